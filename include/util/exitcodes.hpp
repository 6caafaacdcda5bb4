#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int bad_args   = 2;
inline constexpr int io_error   = 3;
inline constexpr int bad_input  = 4;  // chunk could not be parsed or reassembled
inline constexpr int incomplete = 5;  // chunks ran out before a batch completed
}  // namespace exitc
