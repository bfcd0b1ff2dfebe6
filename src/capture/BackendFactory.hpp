#pragma once

#include <memory>

#include "capture/ICaptureBackend.hpp"

namespace screenier {

enum class BackendKind { Auto, X11 };

std::unique_ptr<ICaptureBackend> CreateBackend(BackendKind kind);

}  // namespace screenier
