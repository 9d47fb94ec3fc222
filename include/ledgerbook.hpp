#pragma once

// Ledgerbook umbrella header
// Composes storage, accounting services and file IO

#include "ledgerbook/accounting/account.hpp"
#include "ledgerbook/accounting/budget.hpp"
#include "ledgerbook/accounting/transaction.hpp"
#include "ledgerbook/common/calendar.hpp"
#include "ledgerbook/common/money.hpp"
#include "ledgerbook/io/chart_import.hpp"
#include "ledgerbook/io/csv.hpp"
#include "ledgerbook/io/transaction_export.hpp"
#include "ledgerbook/ledgerbook.hpp"
#include "ledgerbook/validation/validation.hpp"
