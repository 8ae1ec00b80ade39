#pragma once

#include <tessera/protocol/account.hpp>
#include <tessera/protocol/error.hpp>
#include <tessera/protocol/event.hpp>
