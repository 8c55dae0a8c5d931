#pragma once

#include "fs/model/Entry.hpp"

#include <string>

namespace fw::plan {

/// Lower-cases, maps whitespace and '-' to '_', collapses runs of '_' and trims them.
/// Files keep their (lower-cased) extension attached to the separately normalized stem.
/// A result that would be empty or start with '.' keeps the original stem instead.
/// normalize(normalize(x)) == normalize(x).
std::string normalizeName(const std::string& name, fs::model::EntryKind kind);

}
