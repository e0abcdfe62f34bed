#pragma once

#include <cstdlib> // std::getenv

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace almanac::utils::env {
  namespace {
    using types::Err;
    using types::PCStr;
    using types::Result;
    using types::String;

    using error::AlmanacError;
    using enum error::AlmanacErrorCode;
  } // namespace

  /**
   * @brief Retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing a copy of the value, or NotFound if it is unset or empty.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<String> {
#ifdef _WIN32
    char*       rawPtr     = nullptr;
    std::size_t bufferSize = 0;

    if (_dupenv_s(&rawPtr, &bufferSize, name) != 0)
      return Err(AlmanacError(PermissionDenied, "Failed to retrieve environment variable"));

    const types::UniquePointer<char, decltype(&free)> ptrManager(rawPtr, free);

    if (!ptrManager || *ptrManager == '\0')
      return Err(AlmanacError(NotFound, std::format("Environment variable '{}' not found", name)));

    return String(ptrManager.get());
#else
    const PCStr value = std::getenv(name);

    if (!value || *value == '\0')
      return Err(AlmanacError(NotFound, std::format("Environment variable '{}' not found", name)));

    return String(value);
#endif
  }
} // namespace almanac::utils::env
