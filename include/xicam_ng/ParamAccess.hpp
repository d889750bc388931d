#pragma once
#include "xicam_ng/IDriver.hpp"
#include "xicam_ng/Params.hpp"
#include "xicam_ng/Roi.hpp"
#include "xicam_ng/XiError.hpp"
#include <string>
#include <type_traits>

namespace xicam_ng {
namespace detail {

// Maps a parameter value type onto the driver's int/float/string entry points.
// Enumerations travel as int, the way xiAPI declares its selectors.
template <typename T, typename Enable = void>
struct ParamIo;

template <>
struct ParamIo<int> {
    static XI_RETURN get(IDriver& d, HANDLE h, const char* name, int& value)
    {
        return d.get_param_int(h, name, &value);
    }
    static XI_RETURN set(IDriver& d, HANDLE h, const char* name, int value)
    {
        return d.set_param_int(h, name, value);
    }
};

template <>
struct ParamIo<float> {
    static XI_RETURN get(IDriver& d, HANDLE h, const char* name, float& value)
    {
        return d.get_param_float(h, name, &value);
    }
    static XI_RETURN set(IDriver& d, HANDLE h, const char* name, float value)
    {
        return d.set_param_float(h, name, value);
    }
};

template <>
struct ParamIo<std::string> {
    static XI_RETURN get(IDriver& d, HANDLE h, const char* name, std::string& value)
    {
        char buf[256] = {0};
        XI_RETURN err = d.get_param_string(h, name, buf, sizeof(buf));
        if (err == XI_OK) value = buf;
        return err;
    }
};

template <typename T>
struct ParamIo<T, typename std::enable_if<std::is_enum<T>::value>::type> {
    static XI_RETURN get(IDriver& d, HANDLE h, const char* name, T& value)
    {
        int raw = 0;
        XI_RETURN err = d.get_param_int(h, name, &raw);
        if (err == XI_OK) value = static_cast<T>(raw);
        return err;
    }
    static XI_RETURN set(IDriver& d, HANDLE h, const char* name, T value)
    {
        return d.set_param_int(h, name, static_cast<int>(value));
    }
};

template <typename T>
T read_param(IDriver& d, HANDLE h, const std::string& name)
{
    T value{};
    check(ParamIo<T>::get(d, h, name.c_str(), value), "xiGetParam(" + name + ")");
    return value;
}

template <typename T>
void write_param(IDriver& d, HANDLE h, const std::string& name, T value)
{
    check(ParamIo<T>::set(d, h, name.c_str(), value), "xiSetParam(" + name + ")");
}

/// Reads a parameter info modifier such as XI_PRM_INFO_INCREMENT (":inc").
template <typename T>
T read_info(IDriver& d, HANDLE h, const char* name, const char* modifier)
{
    static_assert(std::is_arithmetic<T>::value, "parameter info exists for numeric keys only");
    return read_param<T>(d, h, std::string(name) + modifier);
}

Roi read_roi(IDriver& d, HANDLE h);
Roi write_roi(IDriver& d, HANDLE h, const Roi& roi);
int read_counter(IDriver& d, HANDLE h, XI_COUNTER_SELECTOR counter);

/// Largest multiple of increment not above value.
uint32_t round_down(uint32_t value, int increment);

template <typename T>
struct NonDeduced { using type = T; };

} // namespace detail
} // namespace xicam_ng
