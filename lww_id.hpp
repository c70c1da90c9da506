// lww_id.hpp
#ifndef LWW_ID_HPP
#define LWW_ID_HPP

#include "lww_types.hpp"

#include <string>

/// Random writer id for a new replica, taken from the first 64 bits of a
/// random UUID. Never returns 0.
LwwWriterId generate_writer_id();

/// Random row id: a lowercase UUID string, e.g. "550e8400-e29b-41d4-a716-446655440000".
std::string generate_row_id();

#endif // LWW_ID_HPP
