#ifndef CLIKIT_EXPORT_HPP
#define CLIKIT_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Cross-platform symbol export macros.
 *
 * CLIKIT_PLUGIN_EXPORT marks the entry points an extension module exposes to
 * the discovery engine. They must survive -fvisibility=hidden builds and be
 * exported from DLLs on Windows.
 *
 * Usage in extension sources:
 *   extern "C" CLIKIT_PLUGIN_EXPORT clikit::Action* clikit_command_main();
 */

#if defined(_WIN32) || defined(_WIN64)
    // Windows
    #define CLIKIT_PLUGIN_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang - use visibility attribute for shared libraries
    #define CLIKIT_PLUGIN_EXPORT __attribute__((visibility("default")))
#else
    // Other compilers - no decoration
    #define CLIKIT_PLUGIN_EXPORT
#endif

#endif // CLIKIT_EXPORT_HPP
