#pragma once
#include <QObject>

#include <initializer_list>

class QSocketNotifier;

namespace parkspot {

// Turns SIGINT/SIGTERM into a Qt signal (self-pipe; the handler only writes one byte).
class SignalWatcher : public QObject {
    Q_OBJECT
public:
    explicit SignalWatcher(std::initializer_list<int> signals_to_watch, QObject* parent = nullptr);
    ~SignalWatcher() override;

    bool isActive() const { return notifier_ != nullptr; }

signals:
    void terminationRequested(int signo);

private slots:
    void onReadable();

private:
    static void handler(int signo);
    static int fds_[2];

    QSocketNotifier* notifier_ = nullptr;
};

} // namespace parkspot
