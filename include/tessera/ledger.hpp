#pragma once

#include <tessera/ledger/chronicler.hpp>
#include <tessera/ledger/error.hpp>
#include <tessera/ledger/genesis.hpp>
#include <tessera/ledger/ledger.hpp>
#include <tessera/ledger/state.hpp>
