#pragma once
#include <m3api/xiApi.h>
#include <stdexcept>
#include <string>

namespace xicam_ng {

/// Symbolic name of an xiAPI return code ("XI_TIMEOUT"), or "XI_ERROR" for codes we don't name.
const char* xi_error_name(XI_RETURN code);

/**
 * @brief Failure of an xiAPI call, carrying the driver's raw return code.
 *
 * No sub-classification is invented beyond what callers need for control flow;
 * code() is always the raw value the driver returned.
 */
class XiError : public std::runtime_error {
public:
    XiError(XI_RETURN code, const std::string& operation);

    XI_RETURN code() const { return code_; }
    const std::string& operation() const { return operation_; }

    bool is_timeout() const { return code_ == XI_TIMEOUT; }
    bool is_not_supported() const;
    bool is_invalid_argument() const;

private:
    XI_RETURN code_;
    std::string operation_;
};

/// Throws XiError unless err is XI_OK.
inline void check(XI_RETURN err, const std::string& operation)
{
    if (err != XI_OK)
        throw XiError(err, operation);
}

} // namespace xicam_ng
