#include "mainwindow.h"

#include <QApplication>
#include <KAboutData>
#include <KLocalizedString>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("chalan-qt");

    // KDE application metadata, used by Help > About and desktop file matching
    KAboutData aboutData(
        QStringLiteral("chalan-qt"),              // component name (internal)
        i18n("Chalan"),                           // display name
        QStringLiteral(CHALAN_VERSION_STRING),    // version
        i18n("Delivery chalan and invoice book"), // short description
        KAboutLicense::GPL_V3,                    // license
        i18n("© 2026"),                           // copyright
        QString(),                                // other text (optional)
        QString()                                 // homepage
    );

    aboutData.setOrganizationDomain("chalan.org");
    aboutData.setDesktopFileName(QStringLiteral("org.chalan.chalan-qt"));

    KAboutData::setApplicationData(aboutData);

    // KXmlGuiWindow sets WA_DeleteOnClose, so the window must live on the heap
    auto *window = new MainWindow();
    window->show();

    return app.exec();
}
