#pragma once

namespace paycore::tests {

void test_account_balances();
void test_ledger_deposit_withdrawal();
void test_ledger_dispute_resolve();
void test_ledger_dispute_chargeback();
void test_ledger_rejects_foreign_and_unknown_references();
void test_ledger_dispute_lifecycle_runs_once();
void test_ledger_lazy_accounts_and_snapshot_order();
void test_ledger_stats();

}  // namespace paycore::tests
