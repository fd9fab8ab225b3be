#pragma once
#include "cleanroom/diff.hpp"
#include "cleanroom/snapshot.hpp"
#include "cleanroom/transform.hpp"
#include "cleanroom/validate.hpp"

#include <iosfwd>
#include <vector>

namespace cleanroom::cli {

struct Context; // fwd

void print_header(std::ostream &os, const Context &ctx, const char *mode);
void print_snapshot(std::ostream &os, std::size_t copied, const std::vector<ExclusionNote> &notes);
void print_transform(std::ostream &os, const TransformReport &report);
void print_validation(std::ostream &os, const ValidationResult &result);
void print_diff(std::ostream &os, const DiffReport &report);

} // namespace cleanroom::cli
