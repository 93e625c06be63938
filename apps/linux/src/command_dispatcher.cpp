#include "command_dispatcher.h"
#include <iostream>

RemoteError dispatch_play_pause(RemoteChannel& channel, std::string& detail) {
    std::cout << "Sending play/pause command...\n";
    if (!channel.send_key(KEYCODE_MEDIA_PLAY_PAUSE, detail)) {
        return RemoteError::Send;
    }
    std::cout << "Command sent successfully!\n";
    return RemoteError::None;
}
