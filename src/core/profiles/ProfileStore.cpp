#include "ProfileStore.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTextStream>
#include <boost/log/trivial.hpp>

namespace pyro {

ProfileStore::ProfileStore(const QString& rootDir, const QString& extension)
    : rootDir_(rootDir)
    , extension_(extension.startsWith('.') ? extension.mid(1) : extension)
{
}

bool ProfileStore::ensureRoot() const
{
    if (QDir().mkpath(rootDir_))
        return true;
    BOOST_LOG_TRIVIAL(error) << "[ProfileStore] Cannot create " << rootDir_.toStdString();
    return false;
}

QStringList ProfileStore::list() const
{
    QDir dir(rootDir_);
    if (!dir.exists()) {
        BOOST_LOG_TRIVIAL(debug) << "[ProfileStore] Profile directory does not exist: " << rootDir_.toStdString();
        return {};
    }
    QStringList names = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    names.sort();
    return names;
}

QString ProfileStore::primaryConfigPath(const QString& name) const
{
    return QDir(rootDir_).filePath(name + "/" + name + "." + extension_);
}

const QStringList& ProfileStore::fileDirectives()
{
    static const QStringList directives = {
        "ca", "cert", "key", "tls-auth", "tls-crypt", "pkcs12"
    };
    return directives;
}

QStringList ProfileStore::referencedFiles(const QString& configPath)
{
    QStringList results;
    QFile file(configPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return results;

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QDir baseDir = QFileInfo(configPath).absoluteDir();

    QTextStream in(&file);
    while (!in.atEnd()) {
        const QStringList parts = in.readLine().trimmed().split(whitespace, Qt::SkipEmptyParts);
        if (parts.size() < 2 || !fileDirectives().contains(parts[0]))
            continue;

        QString path = parts[1];
        if (path.size() >= 2 && path.startsWith('"') && path.endsWith('"'))
            path = path.mid(1, path.size() - 2);
        if (path == "[inline]")
            continue;

        const QString resolved = QFileInfo(path).isAbsolute() ? path : baseDir.absoluteFilePath(path);
        if (!QFileInfo::exists(resolved)) {
            BOOST_LOG_TRIVIAL(warning) << "[ProfileStore] " << parts[0].toStdString()
                                       << " file not found: " << resolved.toStdString();
            continue;
        }
        if (!results.contains(resolved))
            results.append(resolved);
    }
    return results;
}

bool ProfileStore::copyOver(const QString& from, const QString& to, QString* error)
{
    if (QFileInfo(from).canonicalFilePath() == QFileInfo(to).canonicalFilePath())
        return true;

    if (QFile::exists(to) && !QFile::remove(to)) {
        if (error)
            *error = QStringLiteral("Cannot replace %1").arg(to);
        return false;
    }

    QFile source(from);
    if (source.copy(to))
        return true;

    if (error)
        *error = QStringLiteral("Cannot copy %1 to %2: %3").arg(from, to, source.errorString());
    return false;
}

QString ProfileStore::importProfile(const QString& sourcePath, QString* error) const
{
    const QFileInfo info(sourcePath);
    if (!info.isFile() || !info.isReadable()) {
        if (error)
            *error = QStringLiteral("Cannot read %1").arg(sourcePath);
        BOOST_LOG_TRIVIAL(warning) << "[ProfileStore] Import failed, unreadable: " << sourcePath.toStdString();
        return {};
    }

    const QString name = info.completeBaseName();
    const QString profileDir = QDir(rootDir_).filePath(name);
    if (name.isEmpty() || !QDir().mkpath(profileDir)) {
        if (error)
            *error = QStringLiteral("Cannot create profile directory %1").arg(profileDir);
        return {};
    }

    if (!copyOver(sourcePath, primaryConfigPath(name), error))
        return {};

    // Keep relative layouts (e.g. "keys/client.key") so the copied config still resolves
    const QDir sourceDir = info.absoluteDir();
    for (const QString& ref : referencedFiles(sourcePath)) {
        QString relative = sourceDir.relativeFilePath(ref);
        if (relative.startsWith("..") || QFileInfo(relative).isAbsolute())
            relative = QFileInfo(ref).fileName();

        const QString target = QDir(profileDir).filePath(relative);
        if (!QDir().mkpath(QFileInfo(target).absolutePath()) || !copyOver(ref, target, error)) {
            if (error && error->isEmpty())
                *error = QStringLiteral("Cannot create directory for %1").arg(target);
            return {};
        }
    }

    BOOST_LOG_TRIVIAL(info) << "[ProfileStore] Imported profile " << name.toStdString()
                            << " from " << sourcePath.toStdString();
    return name;
}

} // namespace pyro
