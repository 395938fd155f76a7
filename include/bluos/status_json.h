#pragma once

#include "bluos/dispatcher.h"
#include "bluos/network_stats.h"
#include "bluos/player_controller.h"

#include <map>
#include <string>

namespace bluos
{

// Machine readable form of a status_all run: an array with one object per
// device, in address order. Failed devices carry "ok": false and the error.
// Network link details are attached where clients has the address.
std::string status_to_json(const std::map<std::string, Outcome<PlayerStatus>> &outcomes,
                           const std::map<std::string, NetworkClient> &clients = {});

} // namespace bluos
