/**
 * @file engine.cpp
 * @brief Decode engine compilation unit.
 *
 * The decode engine, indirection resolver and record field driver are
 * templates over the destination type and live entirely in their
 * headers (engine.hpp, indirect.hpp, record.hpp, tag.hpp).
 *
 * This .cpp file includes the umbrella header so every header is
 * compiled at least once as part of the library.
 *
 * @see include/wirebin/engine.hpp for the implementation
 */

#include <wirebin/wirebin.hpp>

// All implementation is in the headers (template functions)
