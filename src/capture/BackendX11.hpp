#pragma once

#include <memory>

#include "capture/ICaptureBackend.hpp"

namespace screenier {

std::unique_ptr<ICaptureBackend> CreateBackendX11();

}  // namespace screenier
