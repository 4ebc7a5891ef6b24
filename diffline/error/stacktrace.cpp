/*
 * stacktrace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stacktrace.hpp"

#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>

#if defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace diffline::error {

namespace {

#if defined(__linux__) || defined(__APPLE__)
auto demangle(const std::string& mangled) -> std::string {
    int status = 0;
    std::unique_ptr<char, decltype(&free)> demangled(
        abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status),
        &free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
}

auto processString(const std::string& input) -> std::string {
    size_t startIndex = input.find("_Z");
    if (startIndex == std::string::npos) {
        return input;
    }

    size_t endIndex = input.find('+', startIndex);
    if (endIndex == std::string::npos) {
        return input;
    }

    std::string abiName = input.substr(startIndex, endIndex - startIndex);
    std::string result = input;
    result.replace(startIndex, endIndex - startIndex, demangle(abiName));
    return result;
}
#endif

auto prettifyStacktrace(const std::string& input) -> std::string {
    std::string output = input;

    static const std::vector<std::pair<std::string, std::string>> REPLACEMENTS =
        {{"std::__1::", "std::"},
         {"std::__cxx11::", "std::"},
         {", std::allocator<[^<>]+>", ""}};

    for (const auto& [from, to] : REPLACEMENTS) {
        output = std::regex_replace(output, std::regex(from), to);
    }
    output = std::regex_replace(output, std::regex(R"(\s{2,})"), " ");
    return output;
}

auto formatAddress(uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

}  // namespace

StackTrace::StackTrace() { capture(); }

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;
#if defined(__APPLE__) || defined(__linux__)
    for (int i = 0; i < num_frames_; ++i) {
        oss << "\t[" << i << "] " << processFrame(frames_[i], i) << "\n";
    }
#else
    oss << "\tStack trace not available on this platform.\n";
#endif
    return prettifyStacktrace(oss.str());
}

#if defined(__APPLE__) || defined(__linux__)
auto StackTrace::processFrame(void* frame, int frameIndex) const
    -> std::string {
    auto it = symbolCache_.find(frame);
    if (it != symbolCache_.end()) {
        return it->second;
    }

    uintptr_t address = reinterpret_cast<uintptr_t>(frame);
    std::string functionName = "<unknown function>";
    std::string moduleName;
    uintptr_t offset = 0;

    Dl_info dlInfo;
    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase) {
            offset = address - reinterpret_cast<uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname) {
            functionName = demangle(dlInfo.dli_sname);
        }
    }

    if (functionName == "<unknown function>" && symbols_) {
        functionName = processString(symbols_.get()[frameIndex]);
    }

    std::ostringstream oss;
    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }

    std::string result = oss.str();
    symbolCache_[frame] = result;
    return result;
}
#else
auto StackTrace::processFrame(void* frame, int) const -> std::string {
    return "<frame information unavailable> at " +
           formatAddress(reinterpret_cast<uintptr_t>(frame));
}
#endif

void StackTrace::capture() {
#if defined(__APPLE__) || defined(__linux__)
    constexpr int MAX_FRAMES = 64;
    void* framePtrs[MAX_FRAMES];
    num_frames_ = backtrace(framePtrs, MAX_FRAMES);
    if (num_frames_ > 1) {
        // Skip this frame.
        symbols_.reset(backtrace_symbols(framePtrs + 1, num_frames_ - 1), &free);
        frames_.assign(framePtrs + 1, framePtrs + num_frames_);
        num_frames_--;
    } else {
        symbols_.reset();
        frames_.clear();
        num_frames_ = 0;
    }
    symbolCache_.clear();
#endif
}

}  // namespace diffline::error
