#pragma once

#include <stdint.h>

#ifndef BOARD_REV
#define BOARD_REV 1
#endif

namespace Board {

#if BOARD_REV == 1
namespace Led {
constexpr uint8_t Status = 2;
constexpr bool ActiveHigh = true;
}  // namespace Led
#else
#error "Unsupported BOARD_REV value"
#endif

}  // namespace Board
