#pragma once

#include <string>

#include "iddata.hpp"

namespace ctrlkit {

/**
 * @brief Write data as "time,input,output" rows with 17 significant digits.
 *
 * @throws std::runtime_error if the file cannot be written
 */
void writeCsv(const std::string& path, const IdData& data);

/**
 * @brief Read "time,input,output" rows.
 *
 * A header line, blank lines and lines starting with '#' are skipped. The sample time is taken
 * from the time column, which must be uniformly spaced to within 1e-6 relative.
 *
 * @throws std::runtime_error on I/O failure, malformed rows, fewer than two samples or
 *                            non-uniform sampling
 */
IdData readCsv(const std::string& path);

}  // namespace ctrlkit
