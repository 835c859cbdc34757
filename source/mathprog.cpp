#include "mathprog.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "log.hpp"

namespace ctrlkit::mathprog {

const char* toString(Status status) {
    switch (status) {
        case Status::Optimal: return "Optimal";
        case Status::Infeasible: return "Infeasible";
        case Status::UserLimit: return "UserLimit";
        case Status::Error: return "Error";
    }
    return "Unknown";
}

size_t Model::addVariable(VarType type, double lb, double ub, std::string name) {
    if (type == VarType::Binary) {
        lb = 0.0;
        ub = 1.0;
    }
    if (std::isnan(lb) || std::isnan(ub) || lb > ub) {
        throw std::invalid_argument("Model::addVariable: invalid bounds for variable '" + name + "'");
    }
    variables_.push_back(Variable{type, lb, ub, std::move(name)});
    if (!linearObjective_.empty()) {
        linearObjective_.push_back(0.0);
    }
    return variables_.size() - 1;
}

void Model::checkIndex(size_t j) const {
    if (j >= variables_.size()) {
        throw std::invalid_argument("Model: variable index " + std::to_string(j) + " out of range");
    }
}

void Model::addLinearConstraint(LinearConstraint row) {
    for (const auto& [j, coef] : row.terms) {
        checkIndex(j);
        if (!std::isfinite(coef)) {
            throw std::invalid_argument("Model::addLinearConstraint: coefficients must be finite");
        }
    }
    if (row.lb > row.ub) {
        throw std::invalid_argument("Model::addLinearConstraint: lower bound exceeds upper bound");
    }
    linear_.push_back(std::move(row));
}

void Model::addConvexConstraint(ConvexFunction g) {
    if (!g.value || !g.gradient) {
        throw std::invalid_argument("Model::addConvexConstraint: value and gradient callbacks are required");
    }
    convex_.push_back(std::move(g));
}

void Model::setLinearObjective(std::vector<double> c, Sense sense, double constant) {
    if (c.size() != variables_.size()) {
        throw std::invalid_argument("Model::setLinearObjective: one coefficient per variable is required");
    }
    linearObjective_   = std::move(c);
    objectiveConstant_ = constant;
    sense_             = sense;
    convexObjective_   = {};
}

void Model::setConvexObjective(ConvexFunction f) {
    if (!f.value || !f.gradient) {
        throw std::invalid_argument("Model::setConvexObjective: value and gradient callbacks are required");
    }
    convexObjective_   = std::move(f);
    linearObjective_   = {};
    objectiveConstant_ = 0.0;
    sense_             = Sense::Minimize;
}

std::vector<size_t> Model::integerVariables() const {
    std::vector<size_t> idx;
    for (size_t j = 0; j < variables_.size(); ++j) {
        if (variables_[j].type != VarType::Continuous) idx.push_back(j);
    }
    return idx;
}

double Model::objectiveValue(const ColVec& x) const {
    if (hasConvexObjective()) {
        return convexObjective_.value(x);
    }
    double v = objectiveConstant_;
    for (size_t j = 0; j < linearObjective_.size(); ++j) {
        v += linearObjective_[j] * x(static_cast<Eigen::Index>(j));
    }
    return v;
}

MilpResult MilpSolver::solveWithLazyConstraints(const MilpProblem&, const LazyConstraintCallback&) {
    MilpResult result;
    result.status  = Status::Error;
    result.message = "lazy constraints are not supported by this MILP solver";
    return result;
}

namespace {
    using Assignment = std::vector<long long>;

    // State of one outer-approximation solve. Internally everything is minimized.
    class OaRun {
       public:
        OaRun(const Model& model, MilpSolver& milp, ContinuousSolver& continuous, const OaOptions& options)
            : model_(model), milp_(milp), continuous_(continuous), options_(options),
              n_(model.numVariables()), epigraph_(model.hasConvexObjective()),
              sign_(model.sense() == Sense::Maximize ? -1.0 : 1.0), integers_(model.integerVariables()),
              start_(std::chrono::steady_clock::now()) {}

        Result execute();

       private:
        Result solveContinuousOnly();
        Result driveMip();

        NlpProblem baseNlp() const;
        void       buildMaster();
        double     elapsed() const;
        bool       gapClosed() const;
        Assignment assignment(const ColVec& x) const;
        bool       allBinary() const;
        NlpResult  solveFixed(const Assignment& z);
        void       acceptSubproblem(const Assignment& z, const NlpResult& sub);

        // Linearizations at x. With onlyViolated, only constraints (and the epigraph) violated at x.
        std::vector<LinearConstraint> cutsAt(const ColVec& x, bool onlyViolated) const;
        void                          addNoGood(const Assignment& z);

        Result finish(Status status, std::string message);
        void   reportIteration(const char* what) const;

        const Model&      model_;
        MilpSolver&       milp_;
        ContinuousSolver& continuous_;
        const OaOptions&  options_;

        const size_t                                       n_;
        const bool                                         epigraph_;  // Variable n_ bounds a convex objective
        const double                                       sign_;
        const std::vector<size_t>                          integers_;
        const std::chrono::steady_clock::time_point        start_;

        MilpProblem                master_;
        std::map<Assignment, bool> visited_;  // Integer assignment -> subproblem was feasible
        ColVec                     incumbent_;
        double                     ub_         = kInf;
        double                     lb_         = -kInf;
        size_t                     iterations_ = 0;
        bool                       subFailed_  = false;
        bool                       limitHit_   = false;
        Status                     subStatus_  = Status::Error;
        std::string                subMessage_;
    };

    double OaRun::elapsed() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

    bool OaRun::gapClosed() const {
        if (!std::isfinite(ub_)) {
            return false;
        }
        const double gap = ub_ - lb_;
        return gap <= options_.absoluteGap || gap <= options_.relativeGap * std::max(1.0, std::abs(ub_));
    }

    NlpProblem OaRun::baseNlp() const {
        NlpProblem p;
        p.variables         = model_.variables();
        p.linearConstraints = model_.linearConstraints();
        p.convexConstraints = model_.convexConstraints();
        if (epigraph_) {
            p.convexObjective = model_.convexObjective();
        } else {
            p.linearObjective = model_.linearObjective();
            for (auto& c : p.linearObjective) c *= sign_;
            p.objectiveConstant = sign_ * model_.objectiveConstant();
        }
        return p;
    }

    void OaRun::buildMaster() {
        master_.variables   = model_.variables();
        master_.constraints = model_.linearConstraints();
        if (epigraph_) {
            master_.variables.push_back(Variable{VarType::Continuous, -kInf, kInf, "oa_epigraph"});
            master_.objective.assign(n_ + 1, 0.0);
            master_.objective[n_]     = 1.0;
            master_.objectiveConstant = 0.0;
        } else {
            master_.objective = model_.linearObjective();
            for (auto& c : master_.objective) c *= sign_;
            master_.objectiveConstant = sign_ * model_.objectiveConstant();
        }
    }

    Assignment OaRun::assignment(const ColVec& x) const {
        Assignment z;
        z.reserve(integers_.size());
        for (size_t j : integers_) z.push_back(std::llround(x(static_cast<Eigen::Index>(j))));
        return z;
    }

    bool OaRun::allBinary() const {
        return std::all_of(integers_.begin(), integers_.end(),
                           [&](size_t j) { return model_.variables()[j].type == VarType::Binary; });
    }

    std::vector<LinearConstraint> OaRun::cutsAt(const ColVec& xFull, bool onlyViolated) const {
        const ColVec x = xFull.head(static_cast<Eigen::Index>(n_));

        auto linearize = [&](const ConvexFunction& g, double gx) {
            const ColVec grad = g.gradient(x);
            if (static_cast<size_t>(grad.size()) != n_) {
                throw std::invalid_argument("OuterApproximationSolver: gradient size does not match the variables");
            }
            // g(x0) + grad^T (x - x0) <= 0
            LinearConstraint cut;
            for (size_t j = 0; j < n_; ++j) {
                const double gj = grad(static_cast<Eigen::Index>(j));
                if (gj != 0.0) cut.terms.emplace_back(j, gj);
            }
            cut.ub = grad.dot(x) - gx;
            return cut;
        };

        std::vector<LinearConstraint> cuts;
        for (const auto& g : model_.convexConstraints()) {
            const double gx = g.value(x);
            if (!std::isfinite(gx)) continue;
            if (!onlyViolated || gx > options_.feasibilityTolerance) {
                cuts.push_back(linearize(g, gx));
            }
        }

        if (epigraph_) {
            const auto&  f  = model_.convexObjective();
            const double fx = f.value(x);
            const bool   below =
                xFull.size() > static_cast<Eigen::Index>(n_) && xFull(static_cast<Eigen::Index>(n_)) < fx - options_.feasibilityTolerance;
            if (std::isfinite(fx) && (!onlyViolated || below)) {
                // f(x0) + grad^T (x - x0) - eta <= 0
                LinearConstraint cut = linearize(f, fx);
                cut.terms.emplace_back(n_, -1.0);
                cuts.push_back(std::move(cut));
            }
        }
        return cuts;
    }

    void OaRun::addNoGood(const Assignment& z) {
        // sum_{z_j = 0} x_j - sum_{z_j = 1} x_j >= 1 - |{z_j = 1}|
        LinearConstraint cut;
        double           ones = 0.0;
        for (size_t k = 0; k < integers_.size(); ++k) {
            const bool one = z[k] != 0;
            cut.terms.emplace_back(integers_[k], one ? -1.0 : 1.0);
            ones += one ? 1.0 : 0.0;
        }
        cut.lb = 1.0 - ones;
        master_.constraints.push_back(std::move(cut));
    }

    NlpResult OaRun::solveFixed(const Assignment& z) {
        NlpProblem p = baseNlp();
        for (size_t k = 0; k < integers_.size(); ++k) {
            auto& v = p.variables[integers_[k]];
            v.lb = v.ub = static_cast<double>(z[k]);
        }
        return continuous_.solve(p);
    }

    void OaRun::acceptSubproblem(const Assignment& z, const NlpResult& sub) {
        visited_[z] = true;
        if (sub.objective < ub_) {
            ub_        = sub.objective;
            incumbent_ = sub.x;
            for (size_t k = 0; k < integers_.size(); ++k) {
                incumbent_(static_cast<Eigen::Index>(integers_[k])) = static_cast<double>(z[k]);
            }
        }
        const auto cuts = cutsAt(sub.x, false);
        master_.constraints.insert(master_.constraints.end(), cuts.begin(), cuts.end());
    }

    void OaRun::reportIteration(const char* what) const {
        if (options_.verbosity >= 2) {
            log::emit(log::Level::Debug, "OA {:>5}  LB {:>15.8g}  UB {:>15.8g}  {}", iterations_, sign_ * lb_,
                      sign_ * ub_, what);
        }
    }

    Result OaRun::finish(Status status, std::string message) {
        Result result;
        result.status     = status;
        result.iterations = iterations_;
        result.message    = std::move(message);
        if (incumbent_.size() > 0) {
            result.x         = incumbent_;
            result.objective = model_.objectiveValue(incumbent_);
        }
        result.bound = sign_ * std::min(lb_, ub_);

        if (options_.verbosity >= 1) {
            log::emit(log::Level::Info, "OA finished: {} after {} iterations, objective {:.10g}, bound {:.10g} ({})",
                      toString(result.status), result.iterations, result.objective, result.bound, result.message);
        }
        return result;
    }

    Result OaRun::solveContinuousOnly() {
        const NlpResult r = continuous_.solve(baseNlp());
        if (r.status == Status::Optimal) {
            incumbent_ = r.x;
            lb_ = ub_ = r.objective;
        }
        return finish(r.status, r.message.empty() ? "continuous problem" : r.message);
    }

    Result OaRun::execute() {
        if (integers_.empty()) {
            return solveContinuousOnly();
        }

        const NlpResult relaxed = continuous_.solve(baseNlp());
        switch (relaxed.status) {
            case Status::Optimal: break;
            case Status::Infeasible: return finish(Status::Infeasible, "continuous relaxation is infeasible");
            case Status::UserLimit: return finish(Status::UserLimit, "continuous relaxation hit a limit: " + relaxed.message);
            case Status::Error: return finish(Status::Error, "continuous relaxation failed: " + relaxed.message);
        }
        lb_ = relaxed.objective;

        buildMaster();
        const auto rootCuts = cutsAt(relaxed.x, false);
        master_.constraints.insert(master_.constraints.end(), rootCuts.begin(), rootCuts.end());
        reportIteration("relaxation");

        if (options_.mipSolverDrives) {
            return driveMip();
        }

        while (true) {
            if (iterations_ >= options_.iterationLimit) {
                return finish(Status::UserLimit, "iteration limit reached");
            }
            if (elapsed() >= options_.timeLimit) {
                return finish(Status::UserLimit, "time limit reached");
            }
            ++iterations_;

            master_.timeLimit     = options_.timeLimit - elapsed();
            const MilpResult step = milp_.solve(master_);
            switch (step.status) {
                case Status::Optimal: break;
                case Status::Infeasible:
                    if (incumbent_.size() > 0) {
                        lb_ = ub_;
                        return finish(Status::Optimal, "master problem infeasible, incumbent is optimal");
                    }
                    return finish(Status::Infeasible, "master problem is infeasible");
                case Status::UserLimit: return finish(Status::UserLimit, "MILP solver hit a limit: " + step.message);
                case Status::Error: return finish(Status::Error, "MILP solver failed: " + step.message);
            }

            lb_ = std::min(std::max(lb_, step.objective), ub_);
            if (gapClosed()) {
                return finish(Status::Optimal, "gap closed");
            }

            const Assignment z    = assignment(step.x);
            const auto       seen = visited_.find(z);
            if (seen != visited_.end()) {
                if (seen->second) {
                    lb_ = ub_;
                    return finish(Status::Optimal, "integer assignment repeated, gap closed");
                }
                if (!allBinary()) {
                    return finish(Status::Error, "integer assignment repeated with an infeasible subproblem");
                }
                addNoGood(z);
                reportIteration("no-good cut");
                continue;
            }

            const NlpResult sub = solveFixed(z);
            switch (sub.status) {
                case Status::Optimal: acceptSubproblem(z, sub); break;
                case Status::Infeasible: visited_[z] = false; break;
                case Status::UserLimit: return finish(Status::UserLimit, "continuous solver hit a limit: " + sub.message);
                case Status::Error: return finish(Status::Error, "continuous solver failed: " + sub.message);
            }

            const auto cuts = cutsAt(step.x, true);
            master_.constraints.insert(master_.constraints.end(), cuts.begin(), cuts.end());
            reportIteration(sub.status == Status::Optimal ? "feasible subproblem" : "infeasible subproblem");

            if (gapClosed()) {
                return finish(Status::Optimal, "gap closed");
            }
        }
    }

    Result OaRun::driveMip() {
        if (!milp_.supportsLazyConstraints()) {
            return finish(Status::Error, "MILP solver does not support lazy constraints");
        }

        // Past the iteration limit every candidate is accepted unchecked and the run reports UserLimit
        auto callback = [this](const ColVec& x) -> std::vector<LinearConstraint> {
            if (limitHit_ || iterations_ >= options_.iterationLimit) {
                limitHit_ = true;
                return {};
            }
            ++iterations_;
            const Assignment z = assignment(x);

            std::vector<LinearConstraint> cuts;
            if (!visited_.count(z) && !subFailed_) {
                const NlpResult sub = solveFixed(z);
                if (sub.status == Status::Optimal) {
                    acceptSubproblem(z, sub);
                    cuts = cutsAt(sub.x, false);
                } else if (sub.status == Status::Infeasible) {
                    visited_[z] = false;
                } else {
                    subFailed_  = true;
                    subStatus_  = sub.status;
                    subMessage_ = sub.message;
                }
            }

            const auto violated = cutsAt(x, true);
            cuts.insert(cuts.end(), violated.begin(), violated.end());
            reportIteration(violated.empty() ? "candidate accepted" : "lazy cuts");
            return violated.empty() ? std::vector<LinearConstraint>{} : cuts;
        };

        master_.timeLimit     = options_.timeLimit;
        const MilpResult tree = milp_.solveWithLazyConstraints(master_, callback);

        if (subFailed_) {
            return finish(subStatus_, "continuous solver failed: " + subMessage_);
        }
        if (limitHit_) {
            if (tree.status == Status::Optimal) {
                lb_ = std::max(lb_, std::min(tree.objective, ub_));
            }
            return finish(Status::UserLimit, "iteration limit reached");
        }

        switch (tree.status) {
            case Status::Optimal: {
                // The accepted point satisfies every convex constraint
                const ColVec x   = tree.x.head(static_cast<Eigen::Index>(n_));
                const double obj = sign_ * model_.objectiveValue(x);
                if (obj < ub_) {
                    ub_        = obj;
                    incumbent_ = x;
                }
                lb_ = std::min(tree.objective, ub_);
                return finish(Status::Optimal, "branch-and-cut finished");
            }
            case Status::Infeasible:
                if (incumbent_.size() > 0) {
                    lb_ = ub_;
                    return finish(Status::Optimal, "master problem infeasible, incumbent is optimal");
                }
                return finish(Status::Infeasible, "master problem is infeasible");
            case Status::UserLimit:
                lb_ = std::max(lb_, tree.bound);
                return finish(Status::UserLimit, "MILP solver hit a limit: " + tree.message);
            case Status::Error: break;
        }
        return finish(Status::Error, "MILP solver failed: " + tree.message);
    }
}  // namespace

OuterApproximationSolver::OuterApproximationSolver(MilpSolver& milp, ContinuousSolver& continuous, OaOptions options)
    : milp_(milp), continuous_(continuous), options_(std::move(options)) {}

Result OuterApproximationSolver::solve(const Model& model) {
    if (model.numVariables() == 0) {
        throw std::invalid_argument("OuterApproximationSolver: model has no variables");
    }
    if (!model.hasConvexObjective() && model.linearObjective().empty()) {
        throw std::invalid_argument("OuterApproximationSolver: model has no objective");
    }

    OaRun run(model, milp_, continuous_, options_);
    return run.execute();
}

}  // namespace ctrlkit::mathprog
