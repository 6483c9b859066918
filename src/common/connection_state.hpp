#pragma once

enum class ConnectionState { Disconnected, Connecting, Connected, Closing };
