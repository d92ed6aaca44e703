#ifndef CHUNKVAULT_STORE_ERROR_HPP
#define CHUNKVAULT_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkvault {

/**
 * @brief Failure surfaced by the chunk store.
 *
 * Lookups of unknown hashes are not errors and never raise this; they are
 * reported through empty optionals or zero results instead.
 */
class StoreError : public std::runtime_error {
public:
  enum class Kind {
    Integrity,       ///< Stored bytes disagree with their metadata
    Io,              ///< Filesystem failure on the chunk tree
    Metadata,        ///< SQLite failure
    Config,          ///< Invalid or conflicting configuration
    InvalidArgument, ///< Caller passed inconsistent input
  };

  StoreError(Kind kind, const std::string &message);

  Kind kind() const noexcept { return kind_; }

  static const char *kindName(Kind kind) noexcept;

private:
  Kind kind_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_STORE_ERROR_HPP
