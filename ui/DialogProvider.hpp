// User-facing dialogs needed by the controllers. Kept abstract so the
// controllers can run without widgets (tests supply a scripted version).
#pragma once
#include <QString>
#include <QStringList>
#include <optional>

class DialogProvider {
public:
    virtual ~DialogProvider() = default;

    // Multi-file picker limited to the given extensions (without dot).
    // std::nullopt when dismissed.
    virtual std::optional<QStringList> pickFiles(const QString& filterName,
                                                 const QStringList& extensions) = 0;
    // Directory picker; std::nullopt when dismissed.
    virtual std::optional<QString> pickDirectory() = 0;
    virtual void notifyMessage(const QString& text, const QString& title) = 0;
};
