#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace basmgr {

// Root of every error the tool reports at the CLI boundary.
class BasmError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed key, value or rule. Raised before any file is touched.
class ValidationError : public BasmError {
public:
    using BasmError::BasmError;
};

// A file could not be read, written, renamed, or a helper process could not run.
class IoError : public BasmError {
public:
    using BasmError::BasmError;
};

// The external sudoers checker rejected the staged content. The live file
// has not been modified.
class SudoersValidationError : public BasmError {
public:
    SudoersValidationError(const std::string &message, std::string diagnostics)
        : BasmError(message)
        , m_diagnostics(std::move(diagnostics))
    {
    }

    const std::string &diagnostics() const
    {
        return m_diagnostics;
    }

private:
    std::string m_diagnostics;
};

} // namespace basmgr
