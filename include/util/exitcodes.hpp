#pragma once

namespace exitc
{
constexpr int ok        = 0;
constexpr int refused   = 1;  // daemon reachable, command rejected
constexpr int bad_args  = 2;
constexpr int no_server = 3;
}  // namespace exitc
