#include "frame.h"

#include <cstdlib>
#include <cstring>
#include <sstream>

#include <config/config.h>

#if STACKERR_ENABLE_STACK_CAPTURE
  #include <cxxabi.h>
  #include <dlfcn.h>
#endif

namespace stackerr::core::error {

namespace {

#if STACKERR_ENABLE_STACK_CAPTURE
std::string demangle(const char* mangled) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);

    if (status == 0 && demangled) {
        std::string result(demangled);
        std::free(demangled);
        return result;
    }
    return mangled;
}

std::string resolve_symbol(const void* address) {
    Dl_info info{};
    if (::dladdr(address, &info) == 0 || info.dli_sname == nullptr) {
        return {};
    }
    return demangle(info.dli_sname);
}
#endif

} // namespace

std::string Frame::function() const {
    if (has_location_) {
        const char* name = location_.function_name();
        if (name && *name) {
            return qualified_function_name(name);
        }
        return config::UNKNOWN_FIELD;
    }

#if STACKERR_ENABLE_STACK_CAPTURE
    if (address_) {
        std::string symbol = resolve_symbol(address_);
        if (!symbol.empty()) {
            return qualified_function_name(symbol);
        }
    }
#endif

    return config::UNKNOWN_FIELD;
}

std::string Frame::file() const {
    if (has_location_) {
        const char* name = location_.file_name();
        if (name && *name) {
            return name;
        }
    }
    return config::UNKNOWN_FIELD;
}

std::string Frame::to_string(const TraceConfig& config) const {
    std::ostringstream oss;
    oss << function() << '(' << config.relative_path(file()) << ':' << line() << ')';
    return oss.str();
}

std::string Frame::format(bool verbose, const TraceConfig& config) const {
    if (verbose) {
        return "\n\tat " + to_string(config);
    }
    return to_string(config);
}

bool Frame::operator==(const Frame& other) const noexcept {
    if (has_location_ != other.has_location_ || address_ != other.address_) {
        return false;
    }
    if (!has_location_) {
        return true;
    }
    return location_.line() == other.location_.line() &&
           location_.column() == other.location_.column() &&
           std::strcmp(location_.file_name(), other.location_.file_name()) == 0 &&
           std::strcmp(location_.function_name(), other.location_.function_name()) == 0;
}

std::string Frame::qualified_function_name(std::string_view pretty_name) {
    // ABI tags from demangled symbols: "f[abi:cxx11]()"
    std::string untagged(pretty_name);
    for (auto tag = untagged.find("[abi:"); tag != std::string::npos;
         tag = untagged.find("[abi:", tag)) {
        auto close = untagged.find(']', tag);
        if (close == std::string::npos) {
            break;
        }
        untagged.erase(tag, close - tag + 1);
    }

    std::string_view name = untagged;

    // GCC appends template bindings: "... [with T = int]"
    if (name.ends_with(']')) {
        auto pos = name.rfind(" [with ");
        if (pos != std::string_view::npos) {
            name = name.substr(0, pos);
        }
    }

    // Parameter list, unless the name ends in a lambda or local entity
    auto close = name.rfind(')');
    if (close != std::string_view::npos &&
        name.find_first_of(":<>", close) == std::string_view::npos) {
        int depth = 0;
        for (std::size_t i = close + 1; i-- > 0;) {
            if (name[i] == ')') {
                ++depth;
            } else if (name[i] == '(' && --depth == 0) {
                name = name.substr(0, i);
                break;
            }
        }
    }

    // Return type: last space outside of brackets, never inside an operator name
    std::size_t scan_end = name.size();
    auto op = name.rfind("operator");
    if (op != std::string_view::npos) {
        scan_end = op;
    }

    int depth = 0;
    for (std::size_t i = scan_end; i-- > 0;) {
        char c = name[i];
        if (c == '>' || c == ')') {
            ++depth;
        } else if (c == '<' || c == '(') {
            --depth;
        } else if (c == ' ' && depth == 0) {
            name = name.substr(i + 1);
            break;
        }
    }

    if (name.empty()) {
        return config::UNKNOWN_FIELD;
    }
    return std::string(name);
}

} // namespace stackerr::core::error
