#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

/**
 * Mixed-integer convex programming by outer approximation.
 *
 * The MILP master problems and the continuous convex subproblems are delegated to external solvers
 * behind the MilpSolver and ContinuousSolver interfaces. This module owns only the problem model
 * and the outer-approximation loop that coordinates them.
 */
namespace ctrlkit::mathprog {

inline constexpr double kInf = std::numeric_limits<double>::infinity();

enum class VarType {
    Continuous,
    Integer,
    Binary,
};

enum class Sense {
    Minimize,
    Maximize,
};

enum class Status {
    Optimal,
    Infeasible,
    UserLimit,
    Error,
};

const char* toString(Status status);

struct Variable {
    VarType     type = VarType::Continuous;
    double      lb   = -kInf;
    double      ub   = kInf;
    std::string name;
};

// Sparse row lb <= sum_k coef_k x[index_k] <= ub
struct LinearConstraint {
    std::vector<std::pair<size_t, double>> terms;
    double                                 lb = -kInf;
    double                                 ub = kInf;
};

// Smooth convex function given by value and gradient callbacks
struct ConvexFunction {
    std::function<double(const ColVec& x)> value;
    std::function<ColVec(const ColVec& x)> gradient;
};

class Model {
   public:
    // Binary variables always get bounds [0, 1]. Returns the variable index.
    size_t addVariable(VarType type, double lb = -kInf, double ub = kInf, std::string name = {});

    void addLinearConstraint(LinearConstraint row);

    // g(x) <= 0 with g convex
    void addConvexConstraint(ConvexFunction g);

    // Dense objective c^T x + constant, c.size() == numVariables()
    void setLinearObjective(std::vector<double> c, Sense sense = Sense::Minimize, double constant = 0.0);

    // Minimize a smooth convex objective
    void setConvexObjective(ConvexFunction f);

    size_t numVariables() const { return variables_.size(); }

    const std::vector<Variable>&         variables() const { return variables_; }
    const std::vector<LinearConstraint>& linearConstraints() const { return linear_; }
    const std::vector<ConvexFunction>&   convexConstraints() const { return convex_; }

    bool                       hasConvexObjective() const { return static_cast<bool>(convexObjective_.value); }
    const ConvexFunction&      convexObjective() const { return convexObjective_; }
    const std::vector<double>& linearObjective() const { return linearObjective_; }
    double                     objectiveConstant() const { return objectiveConstant_; }
    Sense                      sense() const { return sense_; }

    std::vector<size_t> integerVariables() const;

    // Objective value at x in the model's own sense
    double objectiveValue(const ColVec& x) const;

   private:
    void checkIndex(size_t j) const;

    std::vector<Variable>         variables_;
    std::vector<LinearConstraint> linear_;
    std::vector<ConvexFunction>   convex_;
    std::vector<double>           linearObjective_;
    double                        objectiveConstant_ = 0.0;
    Sense                         sense_             = Sense::Minimize;
    ConvexFunction                convexObjective_;
};

// Minimize objective^T x + objectiveConstant subject to bounds, integrality and rows
struct MilpProblem {
    std::vector<Variable>         variables;
    std::vector<LinearConstraint> constraints;
    std::vector<double>           objective;
    double                        objectiveConstant = 0.0;
    double                        timeLimit         = kInf;  // Seconds
};

struct MilpResult {
    Status      status    = Status::Error;
    ColVec      x         = {};
    double      objective = kInf;
    double      bound     = -kInf;  // Best proven lower bound
    std::string message;
};

// Receives an integer-feasible candidate and returns rows it violates. An empty list accepts it.
using LazyConstraintCallback = std::function<std::vector<LinearConstraint>(const ColVec& x)>;

class MilpSolver {
   public:
    virtual ~MilpSolver() = default;

    virtual MilpResult solve(const MilpProblem& problem) = 0;

    virtual bool supportsLazyConstraints() const { return false; }

    // Single branch-and-cut solve that consults callback at every incumbent candidate
    virtual MilpResult solveWithLazyConstraints(const MilpProblem& problem, const LazyConstraintCallback& callback);
};

// Convex continuous problem: minimize the objective subject to bounds, rows and g(x) <= 0
struct NlpProblem {
    std::vector<Variable>         variables;  // Types are ignored, fixed variables have lb == ub
    std::vector<LinearConstraint> linearConstraints;
    std::vector<ConvexFunction>   convexConstraints;
    std::vector<double>           linearObjective;  // Used when convexObjective is empty
    double                        objectiveConstant = 0.0;
    ConvexFunction                convexObjective;
};

struct NlpResult {
    Status      status    = Status::Error;
    ColVec      x         = {};
    double      objective = kInf;
    std::string message;
};

class ContinuousSolver {
   public:
    virtual ~ContinuousSolver() = default;

    virtual NlpResult solve(const NlpProblem& problem) = 0;
};

struct OaOptions {
    double relativeGap          = 1e-6;   // Stop when UB - LB <= relativeGap * max(1, |UB|)
    double absoluteGap          = 1e-8;   // or when UB - LB <= absoluteGap
    bool   mipSolverDrives      = false;  // Single MILP tree with OA cuts as lazy constraints
    size_t iterationLimit       = 1000;
    double timeLimit            = kInf;  // Seconds
    int    verbosity            = 0;     // 0 silent, 1 summary, 2 one line per iteration
    double feasibilityTolerance = 1e-6;  // Slack allowed on g(x) <= 0 when checking master points
};

struct Result {
    Status      status     = Status::Error;
    ColVec      x          = {};
    double      objective  = kInf;
    double      bound      = -kInf;
    size_t      iterations = 0;
    std::string message;
};

/**
 * @brief Outer-approximation coordinator for convex mixed-integer problems.
 *
 * Both collaborators are borrowed and must outlive the solver. Solver outcomes are returned as a
 * Status, never thrown.
 */
class OuterApproximationSolver {
   public:
    OuterApproximationSolver(MilpSolver& milp, ContinuousSolver& continuous, OaOptions options = {});

    // @throws std::invalid_argument if the model has no variables or no objective
    Result solve(const Model& model);

    const OaOptions& options() const { return options_; }

   private:
    MilpSolver&       milp_;
    ContinuousSolver& continuous_;
    OaOptions         options_;
};

}  // namespace ctrlkit::mathprog
