#pragma once

#include <functional>
#include <string>

// How a background channel task (pump or beacon) saw the shell end.
enum class ChannelEnd {
    RemoteClosed,   // clean EOF from the server
    Error,          // read/write failure
};

class StopSignal;

// Reported from the task's own thread. The StopSignal is the reporting
// task's: the receiver gives up on the report once it is stopped.
using ChannelEndCallback =
    std::function<void(ChannelEnd end, const std::string& reason, StopSignal& reporter)>;
