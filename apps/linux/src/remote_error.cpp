#include "remote_error.h"
#include <iostream>

using namespace std;

const char* remote_error_name(RemoteError err) {
    switch (err) {
    case RemoteError::None:               return "None";
    case RemoteError::Config:             return "ConfigError";
    case RemoteError::Identity:           return "IdentityError";
    case RemoteError::Storage:            return "StorageError";
    case RemoteError::PairingRejected:    return "PairingRejected";
    case RemoteError::PairingInvalidPin:  return "PairingInvalidPin";
    case RemoteError::PairingProtocol:    return "PairingProtocolError";
    case RemoteError::ConnectTimeout:     return "ConnectTimeout";
    case RemoteError::ConnectRefused:     return "ConnectRefused";
    case RemoteError::ResolutionFailure:  return "ResolutionFailure";
    case RemoteError::NetworkUnreachable: return "NetworkUnreachable";
    case RemoteError::ConnectOtherIO:     return "ConnectOtherIO";
    case RemoteError::ConnectAuth:        return "ConnectAuth";
    case RemoteError::Send:               return "SendError";
    }
    return "Unknown";
}

string remote_error_message(RemoteError err) {
    switch (err) {
    case RemoteError::None:               return "No error";
    case RemoteError::Config:             return "Invalid configuration";
    case RemoteError::Identity:           return "Cannot create client certificate";
    case RemoteError::Storage:            return "Cannot save credentials";
    case RemoteError::PairingRejected:    return "Pairing rejected on TV";
    case RemoteError::PairingInvalidPin:  return "Invalid PIN";
    case RemoteError::PairingProtocol:    return "Pairing failed";
    case RemoteError::ConnectTimeout:     return "Connection timeout";
    case RemoteError::ConnectRefused:     return "Connection refused";
    case RemoteError::ResolutionFailure:  return "Cannot resolve host";
    case RemoteError::NetworkUnreachable: return "Network unreachable";
    case RemoteError::ConnectOtherIO:     return "Cannot connect";
    case RemoteError::ConnectAuth:        return "Device did not accept the client certificate";
    case RemoteError::Send:               return "Cannot send command";
    }
    return "Unknown error";
}

string remote_error_hint(RemoteError err, const string& host) {
    switch (err) {
    case RemoteError::Config:
        return "Please enter a valid IP (e.g., 192.168.1.238)";
    case RemoteError::Identity:
    case RemoteError::Storage:
        return "Check that the configuration directory is writable.";
    case RemoteError::PairingRejected:
        return "Please accept the pairing request on the TV and run again.";
    case RemoteError::PairingInvalidPin:
    case RemoteError::PairingProtocol:
        return "Run again with --repair to start a new pairing.";
    case RemoteError::ConnectTimeout:
        return "Is the device at " + host + " powered on?";
    case RemoteError::ConnectRefused:
        return "The device may not have the Android TV Remote service enabled.";
    case RemoteError::ResolutionFailure:
        return "Please check the IP address is correct.";
    case RemoteError::NetworkUnreachable:
        return "Cannot reach " + host + ". Check network connectivity.";
    case RemoteError::ConnectOtherIO:
        return "Verify the IP address, that the device is powered on and the network is up.";
    case RemoteError::ConnectAuth:
        return "The pairing may have been removed on the TV. Run again with --repair.";
    case RemoteError::Send:
        return "The connection dropped; the command was not retried.";
    case RemoteError::None:
        break;
    }
    return string();
}

bool is_connect_error(RemoteError err) {
    switch (err) {
    case RemoteError::ConnectTimeout:
    case RemoteError::ConnectRefused:
    case RemoteError::ResolutionFailure:
    case RemoteError::NetworkUnreachable:
    case RemoteError::ConnectOtherIO:
    case RemoteError::ConnectAuth:
        return true;
    default:
        return false;
    }
}

void report_remote_error(RemoteError err,
                         const string& host,
                         const string& detail) {
    cerr << "Error: " << remote_error_message(err);
    if (is_connect_error(err) && !host.empty()) {
        cerr << " (" << host << ")";
    }
    cerr << "\n";
    if (!detail.empty()) {
        cerr << "Details: " << detail << "\n";
    }
    string hint = remote_error_hint(err, host);
    if (!hint.empty()) {
        cerr << hint << "\n";
    }
}
