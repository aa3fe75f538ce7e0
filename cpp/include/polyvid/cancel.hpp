#pragma once

namespace polyvid::cancel {

// Installs SIGINT/SIGTERM handlers that only raise the cancellation flag.
void InstallSignalHandlers();

bool Requested() noexcept;
void Request() noexcept;
void Reset() noexcept;

// Throws CancelledError when a cancellation was requested.
void ThrowIfRequested();

}  // namespace polyvid::cancel
