#pragma once

// Sitebook: construction-firm ledger core

#include "sitebook/common/error.hpp"
#include "sitebook/common/money.hpp"
#include "sitebook/ledger/allocation.hpp"
#include "sitebook/ledger/balance.hpp"
#include "sitebook/ledger/types.hpp"
#include "sitebook/storage/ledger_store.hpp"
#include "sitebook/storage/sitebook_store.hpp"
#include "sitebook/storage/sqlite_store.hpp"
