#include "parkspot/devices/sysfs_indicator.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace parkspot {

SysfsIndicator::SysfsIndicator(const std::string& value_path)
    : path_(value_path)
{
}

bool SysfsIndicator::set(bool on, IndicatorError& err) {
    if (last_ && *last_ == on) return true;

    std::ofstream ofs(path_, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
        last_.reset();
        err.message = "cannot open " + path_ + ": " + std::strerror(errno);
        return false;
    }
    ofs << (on ? "1" : "0") << '\n';
    ofs.flush();
    if (!ofs) {
        last_.reset();
        err.message = "write to " + path_ + " failed";
        return false;
    }
    last_ = on;
    return true;
}

} // namespace parkspot
