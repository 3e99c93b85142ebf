#pragma once

namespace cintel::core {

constexpr const char* kBuildVersion = "0.1.0";

}  // namespace cintel::core
