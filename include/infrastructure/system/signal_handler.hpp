// EN: Signal Handler for PhonyRun - interrupt forwarding to the running step and orderly cleanup
// FR: Gestionnaire de signaux pour PhonyRun - transmission des interruptions à l'étape en cours et nettoyage ordonné

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include <signal.h>
#include <sys/types.h>

namespace PHR {

// EN: Callback function type for cleanup operations
// FR: Type de fonction callback pour les opérations de nettoyage
using CleanupCallback = std::function<void()>;

// EN: Signal handler configuration structure
// FR: Structure de configuration du gestionnaire de signaux
struct SignalHandlerConfig {
    bool forward_to_child{true};     // EN: Relay SIGINT/SIGTERM to the active subprocess / FR: Relaie SIGINT/SIGTERM au sous-processus actif
};

// EN: Signal handler statistics for monitoring
// FR: Statistiques du gestionnaire de signaux pour monitoring
struct SignalHandlerStats {
    std::chrono::system_clock::time_point created_at;
    size_t signals_received{0};
    size_t signals_forwarded{0};
    size_t cleanup_callbacks_registered{0};
    size_t cleanup_runs{0};
    std::unordered_map<int, size_t> signal_counts; // EN: Count per signal type / FR: Compteur par type de signal
};

// EN: Process-wide signal handler. The C handler only touches atomics; cleanup runs on the main thread.
// FR: Gestionnaire de signaux du processus. Le handler C ne touche que des atomiques ; le nettoyage tourne sur le thread principal.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    void configure(const SignalHandlerConfig& config);
    SignalHandlerConfig getConfig() const;

    // EN: Install SIGINT and SIGTERM handlers (throws std::runtime_error on failure)
    // FR: Installe les handlers SIGINT et SIGTERM (lance std::runtime_error en cas d'échec)
    void initialize();

    // EN: Restore the default dispositions
    // FR: Restaure les comportements par défaut
    void restoreDefaults();

    bool isInitialized() const { return initialized_.load(); }

    void registerCleanupCallback(const std::string& name, CleanupCallback callback);
    void unregisterCleanupCallback(const std::string& name);

    // EN: Subprocess bookkeeping used by the command runner
    // FR: Suivi du sous-processus utilisé par le runner de commandes
    void setActiveChild(pid_t pid);
    void clearActiveChild();
    pid_t getActiveChild() const { return active_child_.load(); }

    // EN: Simulate a received signal (useful for testing)
    // FR: Simule un signal reçu (utile pour les tests)
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const { return shutdown_requested_.load(); }

    // EN: Signal number of the first interrupt, 0 when none
    // FR: Numéro du premier signal d'interruption, 0 si aucun
    int getReceivedSignal() const { return received_signal_.load(); }

    // EN: Run registered cleanup callbacks once, in name order
    // FR: Exécute une fois les callbacks de nettoyage enregistrés, par ordre de nom
    void executeCleanup();

    SignalHandlerStats getStats() const;

    // EN: Clear flags, callbacks and statistics (mainly for testing)
    // FR: Efface flags, callbacks et statistiques (principalement pour les tests)
    void reset();

    void setEnabled(bool enabled);

    ~SignalHandler();

private:
    SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;
    SignalHandler(SignalHandler&&) = delete;
    SignalHandler& operator=(SignalHandler&&) = delete;

    // EN: Static signal handler function (C-style callback)
    // FR: Fonction gestionnaire de signaux statique (callback style C)
    static void signalCallback(int signal_number);

    // EN: Async-signal-safe part shared by the C handler and triggerShutdown
    // FR: Partie async-signal-safe partagée par le handler C et triggerShutdown
    void recordSignal(int signal_number);

    mutable std::mutex mutex_;
    SignalHandlerConfig config_;
    std::chrono::system_clock::time_point created_at_;
    std::map<std::string, CleanupCallback> cleanup_callbacks_;
    size_t cleanup_runs_{0};

    std::atomic<bool> initialized_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<bool> forward_to_child_{true};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> cleanup_done_{false};
    std::atomic<int> received_signal_{0};
    std::atomic<pid_t> active_child_{0};
    std::atomic<size_t> signals_received_{0};
    std::atomic<size_t> signals_forwarded_{0};
    std::atomic<size_t> sigint_count_{0};
    std::atomic<size_t> sigterm_count_{0};

    static SignalHandler* instance_;
};

} // namespace PHR
