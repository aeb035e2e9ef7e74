#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "portico/change_event.hpp"

namespace portico {

/**
 * Strip characters the record store cannot hold from values about to cross
 * a boundary (translation, the wire, logs, write-backs).
 *
 * Every function here is pure and total: it returns a new value, leaves the
 * input untouched, and never fails. Applying it twice gives the same result
 * as applying it once.
 */
namespace sanitizer {

/**
 * Remove every NUL character from a string.
 */
std::string sanitize(const std::string& text);

/**
 * Recursively remove NUL characters from every string leaf.
 *
 * Arrays keep their order and length, objects keep their keys, and
 * numbers, booleans and null pass through unchanged.
 */
nlohmann::json sanitize(const nlohmann::json& value);

/**
 * Sanitize the table name, record and old record of an event.
 */
ChangeEvent sanitize(const ChangeEvent& event);

} // namespace sanitizer
} // namespace portico
