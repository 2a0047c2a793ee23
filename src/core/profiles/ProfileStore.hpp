#pragma once

#include <QString>
#include <QStringList>

namespace pyro {

/// Imported OpenVPN profiles, one subdirectory per profile:
///   <root>/<name>/<name>.<ext> plus the certificate and key files it references.
class ProfileStore {
public:
    explicit ProfileStore(const QString& rootDir, const QString& extension = QStringLiteral("ovpn"));

    QString rootDir() const { return rootDir_; }
    QString extension() const { return extension_; }

    /// Create the root directory if it does not exist yet.
    bool ensureRoot() const;

    /// Sorted names of all profile subdirectories. Empty if the root is missing.
    QStringList list() const;

    QString primaryConfigPath(const QString& name) const;

    /// Copy sourcePath and its referenced files into the store, overwriting
    /// any previous import of the same name. Returns the profile name, or an
    /// empty string with *error set.
    QString importProfile(const QString& sourcePath, QString* error = nullptr) const;

    /// Absolute paths of the existing files referenced by ca/cert/key/
    /// tls-auth/tls-crypt/pkcs12 directives. Relative paths resolve against
    /// the config's own directory.
    static QStringList referencedFiles(const QString& configPath);

    static const QStringList& fileDirectives();

private:
    static bool copyOver(const QString& from, const QString& to, QString* error);

    QString rootDir_;
    QString extension_;
};

} // namespace pyro
