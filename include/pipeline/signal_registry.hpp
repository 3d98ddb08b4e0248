#ifndef SIGNAL_REGISTRY_HPP
#define SIGNAL_REGISTRY_HPP

#include <signal.h>
#include <unistd.h>

// Routes SIGINT/SIGTERM to AppT::cancel() so a running batch can stop its
// collector before exiting.
template <typename AppT>
class SignalRegistry
{
  public:
    inline static AppT* instance_ = nullptr;

    static void registerInstance(AppT* instance)
    {
        instance_ = instance;
        signal(SIGINT, &SignalRegistry::signalHandler);
        signal(SIGTERM, &SignalRegistry::signalHandler);
    }

    static void unregisterInstance()
    {
        instance_ = nullptr;
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
    }

  private:
    static void signalHandler(int)
    {
        static const char message[] = "\nReceived stop signal, cancelling batch...\n";
        ssize_t written = write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)written;
        if (instance_)
            instance_->cancel();
    }
};

#endif // SIGNAL_REGISTRY_HPP
