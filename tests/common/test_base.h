#pragma once

#include <QTest>
#include <QTemporaryDir>
#include <QStandardPaths>
#include <QLoggingCategory>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <memory>

Q_DECLARE_LOGGING_CATEGORY(cutlineTests)

/**
 * Base class for Cutline tests providing common setup and utilities
 * Each test case gets its own temporary directory and database path
 */
class TestBase : public QObject
{
    Q_OBJECT

protected:
    std::unique_ptr<QTemporaryDir> m_testDataDir;
    QString m_testDatabasePath;

    QElapsedTimer m_timer;
    static constexpr int SLOW_TEST_MS = 1000;

public:
    TestBase(QObject *parent = nullptr) : QObject(parent) {}

protected slots:
    /**
     * Initialize test environment before the first test method
     */
    virtual void initTestCase() {
        QLoggingCategory::setFilterRules("cutline.*.debug=false\ncutline.tests=true");
        qCInfo(cutlineTests, "Initializing test case: %s", metaObject()->className());

        m_testDataDir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_testDataDir->isValid());

        m_testDatabasePath = m_testDataDir->filePath("jobs.db");

        QStandardPaths::setTestModeEnabled(true);
    }

    virtual void cleanupTestCase() {
        qCInfo(cutlineTests, "Cleaning up test case: %s", metaObject()->className());
        m_testDataDir.reset();
    }

    virtual void init() {
        m_timer.start();
    }

    virtual void cleanup() {
        auto elapsedMs = m_timer.elapsed();
        if (elapsedMs > SLOW_TEST_MS) {
            qCWarning(cutlineTests, "Slow test detected: %lldms", elapsedMs);
        }
    }

protected:
    /**
     * Fresh database path inside the test directory
     */
    QString freshDatabasePath(const QString& name) const {
        return m_testDataDir->filePath(name + ".db");
    }

    /**
     * Write a file under the test directory and return its absolute path
     */
    QString writeTestFile(const QString& relativePath, const QByteArray& contents,
                          bool executable = false) const {
        const QString path = m_testDataDir->filePath(relativePath);
        QDir().mkpath(QFileInfo(path).absolutePath());

        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            qCWarning(cutlineTests, "Cannot write %s", qPrintable(path));
            return QString();
        }
        file.write(contents);
        file.close();

        if (executable) {
            file.setPermissions(file.permissions() | QFileDevice::ExeOwner | QFileDevice::ExeUser);
        }
        return path;
    }

    /**
     * Verify an operation finished within maxMs of init()
     */
    void verifyPerformance(const QString& operation, int maxMs = 100) {
        auto elapsed = m_timer.elapsed();
        if (elapsed > maxMs) {
            QFAIL(qPrintable(QString("Performance requirement failed: %1 took %2ms (max: %3ms)")
                           .arg(operation).arg(elapsed).arg(maxMs)));
        }
        qCInfo(cutlineTests, "%s completed in %lldms", operation.toUtf8().constData(), elapsed);
    }
};
