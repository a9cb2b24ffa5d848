#include "parkspot/service/signal_watcher.hpp"

#include <QSocketNotifier>
#include <QDebug>

#include <csignal>
#include <cstring>
#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace parkspot {

int SignalWatcher::fds_[2] = {-1, -1};

SignalWatcher::SignalWatcher(std::initializer_list<int> signals_to_watch, QObject* parent)
    : QObject(parent)
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds_) != 0) {
        qWarning() << "[Service] socketpair failed:" << std::strerror(errno)
                   << "- termination signals use the default action";
        return;
    }

    notifier_ = new QSocketNotifier(fds_[1], QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this, &SignalWatcher::onReadable);

    for (int signo : signals_to_watch) {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = &SignalWatcher::handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        if (::sigaction(signo, &sa, nullptr) != 0) {
            qWarning() << "[Service] cannot install handler for signal" << signo << ":" << std::strerror(errno);
        }
    }
}

SignalWatcher::~SignalWatcher() {
    if (notifier_) {
        notifier_->setEnabled(false);
        ::close(fds_[0]);
        ::close(fds_[1]);
        fds_[0] = fds_[1] = -1;
    }
}

void SignalWatcher::handler(int signo) {
    const char c = static_cast<char>(signo);
    if (fds_[0] >= 0) {
        ssize_t n = ::write(fds_[0], &c, sizeof(c));
        (void)n;
    }
}

void SignalWatcher::onReadable() {
    notifier_->setEnabled(false);
    char c = 0;
    if (::read(fds_[1], &c, sizeof(c)) != sizeof(c)) {
        qWarning() << "[Service] failed to read signal number";
    }
    emit terminationRequested(static_cast<int>(c));
    notifier_->setEnabled(true);
}

} // namespace parkspot
