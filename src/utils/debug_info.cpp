/**
 * @file debug_info.cpp
 * @brief Cross-platform stack trace printing for nestjar::debug::print_stack_trace()
 */
#include "nj_base.hpp"

#if defined(NESTJAR_PLATFORM_WIN64)

#include <cstring>
#include <dbghelp.h>
#include <memory>
#pragma comment(lib, "dbghelp.lib")

#elif defined(NESTJAR_IS_POSIX)

#include <cstdlib>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace

#endif

namespace nestjar::debug
{

void print_stack_trace() noexcept
{
    constexpr int kMaxFrames = 62;
#if defined(NESTJAR_PLATFORM_WIN64)
    void *frames[kMaxFrames] = {nullptr};
    USHORT captured = CaptureStackBackTrace(0, kMaxFrames, frames, nullptr);
    HANDLE process = GetCurrentProcess();
    SymInitialize(process, nullptr, TRUE);

    constexpr size_t kNameBuf = 1024;
    std::unique_ptr<uint8_t[]> area(new (std::nothrow)
                                        uint8_t[sizeof(SYMBOL_INFO) + kNameBuf * sizeof(char)]);
    SYMBOL_INFO *symbol = area ? reinterpret_cast<SYMBOL_INFO *>(area.get()) : nullptr;
    if (symbol)
    {
        std::memset(symbol, 0, sizeof(SYMBOL_INFO));
        symbol->SizeOfStruct = sizeof(SYMBOL_INFO);
        symbol->MaxNameLen = static_cast<ULONG>(kNameBuf - 1);
    }

    std::fprintf(stderr, "Stack Trace (most recent call first):\n");
    for (USHORT i = 0; i < captured; ++i)
    {
        const auto addr = reinterpret_cast<DWORD64>(frames[i]);
        if (symbol && SymFromAddr(process, addr, nullptr, symbol))
            std::fprintf(stderr, "  #%02u  0x%016llx  %s\n", static_cast<unsigned>(i),
                         static_cast<unsigned long long>(addr), symbol->Name);
        else
            std::fprintf(stderr, "  #%02u  0x%016llx\n", static_cast<unsigned>(i),
                         static_cast<unsigned long long>(addr));
    }
    SymCleanup(process);
#elif defined(NESTJAR_IS_POSIX)
    void *frames[kMaxFrames];
    const int captured = backtrace(frames, kMaxFrames);
    std::fprintf(stderr, "Stack Trace (most recent call first):\n");
    // Frame 0 is this function.
    for (int i = 1; i < captured; ++i)
    {
        Dl_info info{};
        if (dladdr(frames[i], &info) && info.dli_sname)
        {
            int status = 0;
            char *demangled = abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, &status);
            std::fprintf(stderr, "  #%02d  %p  %s (%s)\n", i - 1, frames[i],
                         (status == 0 && demangled) ? demangled : info.dli_sname,
                         info.dli_fname ? info.dli_fname : "?");
            std::free(demangled);
        }
        else
        {
            std::fprintf(stderr, "  #%02d  %p  <unknown>\n", i - 1, frames[i]);
        }
    }
#else
    (void)kMaxFrames;
    std::fprintf(stderr, "Stack trace not available on this platform.\n");
#endif
    std::fflush(stderr);
}

} // namespace nestjar::debug
