#pragma once

/**
 * @file apply.hpp
 * @brief Writing classified results back to the working tree
 */

#include "recon/common.hpp"
#include "recon/results.hpp"

namespace recon::report {

/**
 * Apply every classified result under the container's project root:
 * generated and refactored files are written, deleted files removed, moved
 * files removed from their old path and written to the new one. Contents are
 * printed without any marker. Stops at the first failure (ApplyFailed).
 */
[[nodiscard]] recon::VoidResult apply_changes(const results::ResultsContainer& container);

}  // namespace recon::report
