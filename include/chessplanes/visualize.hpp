#pragma once

#include <iosfwd>
#include <string>

#include "chessplanes/planes.hpp"

namespace chessplanes {

// Combined view: one symbol per square from the first active piece channel
// (PNBRQK for White, pnbrqk for Black), '.' when none. Rank 8 is printed
// first, followed by a file-letter footer.
void render(std::ostream& out, const PlaneTensor& x);

// Single channel: '1' where the value exceeds 0.5, '.' elsewhere.
// Throws std::out_of_range for a channel outside the tensor.
void render_channel(std::ostream& out, const PlaneTensor& x, int channel);

std::string to_string(const PlaneTensor& x);
std::string channel_to_string(const PlaneTensor& x, int channel);

} // namespace chessplanes
