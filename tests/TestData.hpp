#pragma once

#include "core/Table.hpp"
#include "core/Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace testdata {

/**
 * Gaussian blobs, one per class, centres spaced `separation` apart along
 * every feature. Class c is named classNames[c] and gets counts[c] rows.
 */
void makeBlobs(const std::vector<size_t>& counts,
               const std::vector<std::string>& classNames,
               int features,
               double separation,
               uint32_t seed,
               FeatureMatrix& X,
               LabelVector& y);

/**
 * Two classes on a line, 10 apart: majority rows at x = 0, 10, ..., minority
 * rows continue from x = 10 * majority. Column 1 is a category code
 * (0 for the majority, alternating 1/2 for the minority).
 * Only the minority row next to the majority block has a half-foreign
 * 10-neighbourhood.
 */
void makeLine(size_t majority, size_t minority, FeatureMatrix& X, LabelVector& y);

// Fresh directory under the system temp dir, named after the running test
std::string scratchDir(const std::string& tag);

/**
 * KDD-shaped feature and target tables with n rows: the three categorical
 * columns, the 28 scaled columns and one column that is not selected.
 * attack_category cycles through normal/dos/probe/r2l with weights 6:3:2:1,
 * target is "normal" or "attack".
 */
void makeKddTables(size_t n, uint32_t seed, Table& features, Table& targets);

void writeTable(const Table& table, const std::string& path);

} // namespace testdata
