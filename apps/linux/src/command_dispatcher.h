#pragma once
#include "remote_link.h"
#include <string>

// Sends exactly one play/pause toggle. Never retried: a second toggle
// after an unknown outcome could undo the first.
RemoteError dispatch_play_pause(RemoteChannel& channel, std::string& detail);
