#include "acquisition_loop.hpp"
#include "trader/offer_evaluation/offer_evaluator.hpp"
#include <utility>

namespace GiftSniper {
namespace Core {

using API::AuthRequiredError;
using API::OperationCancelledError;
using API::PlatformError;

AcquisitionLoop::AcquisitionLoop(const Config::RunConfig& run_config,
                                 API::PlatformClientInterface& platform_client_ref,
                                 CancellationSignal& cancellation_signal_ref,
                                 Logging::AcquisitionLogs& acquisition_logs_ref)
    : config(run_config), platform_client(platform_client_ref),
      cancellation_signal(cancellation_signal_ref), logs(acquisition_logs_ref) {}

RunResult AcquisitionLoop::run() {
    RunResult run_result;

    SetupResult setup_result = authenticate(run_result);
    if (setup_result == SetupResult::CANCELLED) {
        return finish_cancelled();
    }
    if (setup_result == SetupResult::FAILED) {
        return finish(std::move(run_result));
    }

    try {
        while (true) {
            if (cancellation_signal.is_requested()) {
                return finish_cancelled();
            }

            state.store(AcquisitionState::POLLING_CATALOG);
            CatalogSnapshot catalog_snapshot;
            PollResult poll_result = poll_catalog(catalog_snapshot);
            if (poll_result == PollResult::CANCELLED) {
                return finish_cancelled();
            }
            if (poll_result == PollResult::EVALUATE) {
                state.store(AcquisitionState::EVALUATING_OFFERS);
                std::vector<Offer> candidates = OfferEvaluator::select_candidates(catalog_snapshot, config.max_price_stars);

                if (!candidates.empty()) {
                    BatchResult batch_result = attempt_candidates(candidates, run_result);
                    if (batch_result == BatchResult::PURCHASED) {
                        return finish(std::move(run_result));
                    }
                    if (batch_result == BatchResult::CANCELLED) {
                        return finish_cancelled();
                    }
                }
            }

            if (wait_poll_interval()) {
                return finish_cancelled();
            }
        }
    } catch (const AuthRequiredError& auth_exception_error) {
        logs.log_session_rejected(auth_exception_error.what());
        run_result.outcome = RunOutcome::ERROR;
        run_result.reason = "authorization required";
        return finish(std::move(run_result));
    }
}

AcquisitionLoop::SetupResult AcquisitionLoop::authenticate(RunResult& run_result) {
    state.store(AcquisitionState::AUTHENTICATING);
    run_result.outcome = RunOutcome::ERROR;

    try {
        if (platform_client.try_open() == API::SessionStatus::AUTH_REQUIRED) {
            logs.log_auth_required();
            run_result.reason = "authorization required";
            return SetupResult::FAILED;
        }

        double balance = stars_value(platform_client.get_balance(PeerRef::self()));
        logs.log_balance(balance);

        recipient_peer = platform_client.resolve_recipient(config.recipient);
        logs.log_recipient(config.recipient);
    } catch (const AuthRequiredError&) {
        logs.log_auth_required();
        run_result.reason = "authorization required";
        return SetupResult::FAILED;
    } catch (const OperationCancelledError&) {
        return SetupResult::CANCELLED;
    } catch (const PlatformError& platform_exception_error) {
        logs.log_setup_error(platform_exception_error.what());
        run_result.reason = platform_exception_error.what();
        return SetupResult::FAILED;
    }
    return SetupResult::READY;
}

AcquisitionLoop::PollResult AcquisitionLoop::poll_catalog(CatalogSnapshot& catalog_snapshot) {
    CatalogResponse catalog_response;
    try {
        catalog_response = platform_client.get_catalog(continuation_hash.load());
    } catch (const AuthRequiredError&) {
        throw;
    } catch (const OperationCancelledError&) {
        return PollResult::CANCELLED;
    } catch (const PlatformError& platform_exception_error) {
        logs.log_catalog_fetch_error(platform_exception_error.what());
        return PollResult::WAIT;
    }

    if (catalog_response.is_not_modified()) {
        return PollResult::WAIT;
    }

    continuation_hash.store(catalog_response.snapshot.hash);
    if (catalog_response.snapshot.offers.empty()) {
        return PollResult::WAIT;
    }

    catalog_snapshot = std::move(catalog_response.snapshot);
    return PollResult::EVALUATE;
}

AcquisitionLoop::BatchResult AcquisitionLoop::attempt_candidates(const std::vector<Offer>& candidates, RunResult& run_result) {
    for (const Offer& candidate : candidates) {
        if (cancellation_signal.is_requested()) {
            return BatchResult::CANCELLED;
        }

        state.store(AcquisitionState::VERIFYING_BALANCE);
        double balance = 0.0;
        try {
            balance = stars_value(platform_client.get_balance(PeerRef::self()));
        } catch (const AuthRequiredError&) {
            throw;
        } catch (const OperationCancelledError&) {
            return BatchResult::CANCELLED;
        } catch (const PlatformError& platform_exception_error) {
            // Without a fresh balance no candidate in this batch can be gated
            logs.log_balance_fetch_error(platform_exception_error.what());
            return BatchResult::EXHAUSTED;
        }

        if (!OfferEvaluator::has_sufficient_balance(balance, candidate.price)) {
            logs.log_insufficient_balance(candidate.id, balance, candidate.price);
            continue;
        }

        if (cancellation_signal.is_requested()) {
            return BatchResult::CANCELLED;
        }

        state.store(AcquisitionState::ATTEMPTING_PURCHASE);
        PurchaseResult purchase_result = attempt_purchase(candidate);
        if (purchase_result == PurchaseResult::CANCELLED) {
            return BatchResult::CANCELLED;
        }
        if (purchase_result == PurchaseResult::PURCHASED) {
            run_result.outcome = RunOutcome::SUCCESS;
            run_result.purchase = PurchaseRecord{candidate.id, candidate.price};
            run_result.reason = "purchased gift " + std::to_string(candidate.id);
            return BatchResult::PURCHASED;
        }
    }
    return BatchResult::EXHAUSTED;
}

AcquisitionLoop::PurchaseResult AcquisitionLoop::attempt_purchase(const Offer& candidate) {
    PaymentForm payment_form;
    try {
        payment_form = platform_client.create_payment_form(recipient_peer, candidate.id);
    } catch (const AuthRequiredError&) {
        throw;
    } catch (const OperationCancelledError&) {
        return PurchaseResult::CANCELLED;
    } catch (const PlatformError& platform_exception_error) {
        logs.log_payment_form_error(candidate.id, platform_exception_error.what());
        return PurchaseResult::FAILED;
    }

    if (payment_form.kind == PaymentFormKind::UNEXPECTED) {
        logs.log_unexpected_form_type(candidate.id, payment_form.type_name);
        return PurchaseResult::FAILED;
    }

    // Last point where a stop request prevents the payment
    if (cancellation_signal.is_requested()) {
        return PurchaseResult::CANCELLED;
    }

    SubmissionResult submission_result;
    try {
        submission_result = platform_client.submit_payment_form(payment_form);
    } catch (const AuthRequiredError&) {
        throw;
    } catch (const PlatformError& platform_exception_error) {
        logs.log_payment_error(candidate.id, platform_exception_error.what());
        return PurchaseResult::FAILED;
    }

    if (submission_result.verification_needed) {
        logs.log_payment_verification_required(candidate.id, submission_result.verification_url);
        return PurchaseResult::FAILED;
    }

    logs.log_purchase_success(candidate.id, candidate.price);
    return PurchaseResult::PURCHASED;
}

bool AcquisitionLoop::wait_poll_interval() {
    return cancellation_signal.wait_for(std::chrono::seconds(config.poll_interval_sec));
}

RunResult AcquisitionLoop::finish(RunResult run_result) {
    state.store(AcquisitionState::DONE);
    logs.log_run_finished(run_result);
    return run_result;
}

RunResult AcquisitionLoop::finish_cancelled() {
    logs.log_cancelled();
    RunResult run_result;
    run_result.outcome = RunOutcome::CANCELLED;
    run_result.reason = "stop requested";
    return finish(std::move(run_result));
}

} // namespace Core
} // namespace GiftSniper
