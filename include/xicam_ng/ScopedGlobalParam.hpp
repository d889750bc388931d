#pragma once
#include "xicam_ng/IDriver.hpp"
#include "xicam_ng/ParamAccess.hpp"
#include "xicam_ng/Params.hpp"
#include "xicam_ng/XiError.hpp"
#include <iostream>

namespace xicam_ng {

/**
 * @brief Sets a global (null-handle) parameter for the lifetime of the object.
 *
 * The previous value is read on construction and written back on
 * destruction, on every exit path. Used for settings that must be in place
 * while a device is being opened, such as auto_bandwidth_calculation.
 */
template <typename T>
class ScopedGlobalParam {
public:
    ScopedGlobalParam(IDriver& driver, Param<T> param, T value)
        : driver_(driver),
          param_(param),
          saved_(detail::read_param<T>(driver, nullptr, param.name))
    {
        detail::write_param<T>(driver_, nullptr, param_.name, value);
    }

    ~ScopedGlobalParam()
    {
        XI_RETURN stat = detail::ParamIo<T>::set(driver_, nullptr, param_.name, saved_);
        if (stat != XI_OK)
            std::cerr << "[ScopedGlobalParam] failed to restore " << param_.name << ": "
                      << xi_error_name(stat) << " (" << stat << ")\n";
    }

    ScopedGlobalParam(const ScopedGlobalParam&) = delete;
    ScopedGlobalParam& operator=(const ScopedGlobalParam&) = delete;

    const T& saved() const { return saved_; }

private:
    IDriver& driver_;
    Param<T> param_;
    T saved_;
};

} // namespace xicam_ng
