#include "xicam_ng/XiError.hpp"

namespace xicam_ng {

const char* xi_error_name(XI_RETURN code)
{
    switch (code) {
    case XI_OK:                   return "XI_OK";
    case XI_INVALID_HANDLE:       return "XI_INVALID_HANDLE";
    case XI_TIMEOUT:              return "XI_TIMEOUT";
    case XI_INVALID_ARG:          return "XI_INVALID_ARG";
    case XI_NOT_SUPPORTED:        return "XI_NOT_SUPPORTED";
    case XI_MEMORY_ALLOCATION:    return "XI_MEMORY_ALLOCATION";
    case XI_NOT_IMPLEMENTED:      return "XI_NOT_IMPLEMENTED";
    case XI_ACQUISITION_STOPED:   return "XI_ACQUISITION_STOPED";
    case XI_WRONG_PARAM_VALUE:    return "XI_WRONG_PARAM_VALUE";
    case XI_WRONG_PARAM_TYPE:     return "XI_WRONG_PARAM_TYPE";
    case XI_BUFFER_TOO_SMALL:     return "XI_BUFFER_TOO_SMALL";
    case XI_NOT_SUPPORTED_PARAM:  return "XI_NOT_SUPPORTED_PARAM";
    case XI_READ_ONLY_PARAM:      return "XI_READ_ONLY_PARAM";
    default:                      return "XI_ERROR";
    }
}

XiError::XiError(XI_RETURN code, const std::string& operation)
    : std::runtime_error(operation + " failed: " + xi_error_name(code) +
                         " (" + std::to_string(code) + ")"),
      code_(code),
      operation_(operation)
{}

bool XiError::is_not_supported() const
{
    return code_ == XI_NOT_SUPPORTED || code_ == XI_NOT_IMPLEMENTED ||
           code_ == XI_NOT_SUPPORTED_PARAM;
}

bool XiError::is_invalid_argument() const
{
    return code_ == XI_INVALID_ARG || code_ == XI_WRONG_PARAM_VALUE;
}

} // namespace xicam_ng
