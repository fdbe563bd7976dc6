#pragma once

namespace cedarmcp {

constexpr const char* kServerName = "cedarscript-mcp-server";
constexpr const char* kServerVersion = "0.1.0";

} // namespace cedarmcp
