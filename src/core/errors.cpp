#include "clikit/errors.hpp"

#include <csignal>
#include <cstdlib>
#include <sstream>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace clikit {

namespace {

std::string demangle(const char* name) {
#if defined(__GNUC__) || defined(__clang__)
    int status = 0;
    char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        std::string result(demangled);
        std::free(demangled);
        return result;
    }
#endif
    return name;
}

// Only the qualifier before any template argument list is dropped
std::string strip_namespaces(const std::string& type_name) {
    auto end = type_name.find('<');
    auto pos = type_name.rfind("::", end == std::string::npos ? std::string::npos : end);
    return pos == std::string::npos ? type_name : type_name.substr(pos + 2);
}

void append_nested(std::ostringstream& os, const std::exception& e, int depth) {
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        os << "\n" << std::string(static_cast<size_t>(depth) * 2, ' ')
           << "caused by: " << exception_type_name(nested) << ": " << nested.what();
        append_nested(os, nested, depth + 1);
    } catch (...) {
        os << "\n" << std::string(static_cast<size_t>(depth) * 2, ' ')
           << "caused by: unknown exception";
    }
}

extern "C" void on_interrupt(int) {
    static const char kMessage[] = "\nInterrupted.\n";
#ifdef _WIN32
    _write(2, kMessage, sizeof(kMessage) - 1);
#else
    auto written = write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
    (void)written;
#endif
    std::_Exit(130);
}

} // namespace

std::string exception_type_name(const std::exception& e) {
    return demangle(typeid(e).name());
}

std::string describe_exception(const std::exception& e, bool full) {
    std::ostringstream os;
    if (!full) {
        os << strip_namespaces(exception_type_name(e)) << ": " << e.what();
        return os.str();
    }
    os << exception_type_name(e) << ": " << e.what();
    append_nested(os, e, 1);
    return os.str();
}

int report_uncaught(const std::exception& e, const ExecutionContext& ctx) {
    if (ctx.is_debug()) {
        ctx.err() << "Error: " << describe_exception(e, true) << std::endl;
    } else {
        ctx.err() << "Error: " << describe_exception(e, false) << std::endl;
        ctx.err() << "Use --debug for full details" << std::endl;
    }
    return 1;
}

void install_interrupt_handler() {
    std::signal(SIGINT, on_interrupt);
}

} // namespace clikit
