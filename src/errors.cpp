// ============================================================================
// errors.cpp — Error type constructors
// ============================================================================

#include "proplogic/errors.hpp"

namespace proplogic {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

}  // namespace

SyntaxError::SyntaxError(std::string reason, std::size_t offset,
                         std::uint32_t line, std::uint32_t column)
    : std::runtime_error(std::to_string(line) + ": ERROR: " + reason +
                         " at column " + std::to_string(column)),
      reason_(std::move(reason)),
      offset_(offset),
      line_(line),
      column_(column) {}

InvalidAtomNameError::InvalidAtomNameError(std::string name)
    : std::runtime_error("invalid atom name: '" + name + "'"),
      name_(std::move(name)) {}

UnboundAtomError::UnboundAtomError(std::vector<std::string> atoms)
    : std::runtime_error("formula has unbound atoms: " + join_names(atoms)),
      atoms_(std::move(atoms)) {}

}  // namespace proplogic
