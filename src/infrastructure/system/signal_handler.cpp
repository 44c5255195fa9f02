// EN: Implementation of the SignalHandler class. Forwards interrupts to the running step.
// FR: Implémentation de la classe SignalHandler. Transmet les interruptions à l'étape en cours.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstring>
#include <stdexcept>
#include <vector>

namespace PHR {

// EN: Static instance pointer read by the C handler
// FR: Pointeur d'instance statique lu par le handler C
SignalHandler* SignalHandler::instance_ = nullptr;

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    instance_ = &instance;
    return instance;
}

SignalHandler::SignalHandler()
    : created_at_(std::chrono::system_clock::now()) {
}

SignalHandler::~SignalHandler() {
    if (initialized_.load()) {
        restoreDefaults();
    }
    instance_ = nullptr;
}

void SignalHandler::configure(const SignalHandlerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    forward_to_child_ = config.forward_to_child;
}

SignalHandlerConfig SignalHandler::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

// EN: Register SIGINT and SIGTERM with sigaction; SA_RESTART keeps waitpid/read going.
// FR: Enregistre SIGINT et SIGTERM avec sigaction ; SA_RESTART laisse waitpid/read continuer.
void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_DEBUG("signal_handler", "SignalHandler already initialized");
        return;
    }

    if (!enabled_.load()) {
        LOG_WARN("signal_handler", "SignalHandler is disabled, skipping initialization");
        return;
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &action, nullptr) != 0) {
        LOG_ERROR("signal_handler", "Failed to register SIGINT handler");
        throw std::runtime_error("Failed to register SIGINT handler");
    }

    if (sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_ERROR("signal_handler", "Failed to register SIGTERM handler");
        // EN: Restore SIGINT handler before throwing
        // FR: Restaure le handler SIGINT avant de lancer l'exception
        signal(SIGINT, SIG_DFL);
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    initialized_ = true;
    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::restoreDefaults() {
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    initialized_ = false;
}

void SignalHandler::registerCleanupCallback(const std::string& name, CleanupCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_[name] = std::move(callback);
    LOG_DEBUG("signal_handler", "Registered cleanup callback: " + name +
              " (total: " + std::to_string(cleanup_callbacks_.size()) + ")");
}

void SignalHandler::unregisterCleanupCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cleanup_callbacks_.find(name);
    if (it != cleanup_callbacks_.end()) {
        cleanup_callbacks_.erase(it);
        LOG_DEBUG("signal_handler", "Unregistered cleanup callback: " + name);
    } else {
        LOG_WARN("signal_handler", "Cleanup callback not found for unregistration: " + name);
    }
}

void SignalHandler::setActiveChild(pid_t pid) {
    active_child_ = pid;

    // EN: A signal that arrived between fork and registration still reaches the child.
    // FR: Un signal arrivé entre le fork et l'enregistrement atteint quand même l'enfant.
    int pending = received_signal_.load();
    if (pending != 0 && pid > 0 && forward_to_child_.load()) {
        if (kill(pid, pending) == 0) {
            ++signals_forwarded_;
        }
    }
}

void SignalHandler::clearActiveChild() {
    active_child_ = 0;
}

void SignalHandler::triggerShutdown(int signal_number) {
    LOG_INFO("signal_handler", "Manual shutdown triggered with signal: " + std::to_string(signal_number));
    recordSignal(signal_number);
}

void SignalHandler::signalCallback(int signal_number) {
    SignalHandler* handler = instance_;
    if (handler && handler->enabled_.load()) {
        handler->recordSignal(signal_number);
    }
}

// EN: Only atomics and kill(2) here: this runs inside the signal handler.
// FR: Uniquement des atomiques et kill(2) ici : ce code tourne dans le handler de signal.
void SignalHandler::recordSignal(int signal_number) {
    ++signals_received_;
    if (signal_number == SIGINT) {
        ++sigint_count_;
    } else if (signal_number == SIGTERM) {
        ++sigterm_count_;
    }

    int expected = 0;
    received_signal_.compare_exchange_strong(expected, signal_number);
    shutdown_requested_ = true;

    pid_t child = active_child_.load();
    if (child > 0 && forward_to_child_.load()) {
        if (kill(child, signal_number) == 0) {
            ++signals_forwarded_;
        }
    }
}

void SignalHandler::executeCleanup() {
    if (cleanup_done_.exchange(true)) {
        return;
    }

    std::vector<std::pair<std::string, CleanupCallback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.assign(cleanup_callbacks_.begin(), cleanup_callbacks_.end());
        ++cleanup_runs_;
    }

    for (const auto& [name, callback] : callbacks) {
        try {
            callback();
            LOG_DEBUG("signal_handler", "Cleanup callback completed: " + name);
        } catch (const std::exception& e) {
            LOG_ERROR("signal_handler", "Cleanup callback '" + name + "' failed: " + e.what());
        }
    }
}

SignalHandlerStats SignalHandler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SignalHandlerStats stats;
    stats.created_at = created_at_;
    stats.signals_received = signals_received_.load();
    stats.signals_forwarded = signals_forwarded_.load();
    stats.cleanup_callbacks_registered = cleanup_callbacks_.size();
    stats.cleanup_runs = cleanup_runs_;
    if (sigint_count_.load() > 0) {
        stats.signal_counts[SIGINT] = sigint_count_.load();
    }
    if (sigterm_count_.load() > 0) {
        stats.signal_counts[SIGTERM] = sigterm_count_.load();
    }
    return stats;
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    cleanup_callbacks_.clear();
    cleanup_runs_ = 0;
    shutdown_requested_ = false;
    cleanup_done_ = false;
    received_signal_ = 0;
    active_child_ = 0;
    signals_received_ = 0;
    signals_forwarded_ = 0;
    sigint_count_ = 0;
    sigterm_count_ = 0;
    created_at_ = std::chrono::system_clock::now();
}

void SignalHandler::setEnabled(bool enabled) {
    enabled_ = enabled;
    LOG_DEBUG("signal_handler", "SignalHandler " + std::string(enabled ? "enabled" : "disabled"));
}

} // namespace PHR
