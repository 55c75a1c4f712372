#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <vector>

#include <sitebook/common/error.hpp>
#include <sitebook/ledger/types.hpp>

namespace sitebook::storage {
    class LedgerStore;
}

namespace sitebook::ledger {

    /// Spread a payment over open invoices oldest first.
    /// Invoices with equal dates keep their input order. Nothing is persisted.
    /// @param invoices Open invoices with their remaining balances
    /// @param payment_amount Base-currency amount to distribute
    /// @return One request per invoice that receives a share
    std::vector<AllocationRequest> autoAllocateFIFO(std::vector<OpenInvoice> invoices, Money payment_amount);

    // ===========================================
    // AllocationEngine - payment to invoice matching
    // ===========================================

    class AllocationEngine {
      public:
        explicit AllocationEngine(storage::LedgerStore &store);

        /// Invoices of one type for a company or project that are not fully paid
        dp::Result<std::vector<OpenInvoice>, dp::Error> getOpenInvoices(Id entity_id, EntityKind entity,
                                                                        TxType invoice_type);

        /// FIFO proposal for an existing payment. Shares the payment already holds
        /// count as available again.
        dp::Result<std::vector<AllocationRequest>, dp::Error> suggestAllocations(Id payment_id);

        /// Replace the payment's whole allocation set in one step.
        /// Duplicate invoice ids are merged; an empty set clears the allocations.
        dp::Result<void, dp::Error> setAllocationsForPayment(Id payment_id,
                                                             const std::vector<AllocationRequest> &allocations);

        /// Allocations of a payment with invoice details, oldest invoice first
        dp::Result<std::vector<AllocationDetail>, dp::Error> getAllocationsForPayment(Id payment_id);

        /// Allocations of an invoice with payment details, oldest payment first
        dp::Result<std::vector<AllocationDetail>, dp::Error> getAllocationsForInvoice(Id invoice_id);

      private:
        storage::LedgerStore &store_;

        dp::Result<std::vector<AllocationDetail>, dp::Error> queryDetails(Id id, bool by_payment);
    };

} // namespace sitebook::ledger
