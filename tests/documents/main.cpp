#include <QGuiApplication>
#include <gtest/gtest.h>

// Text layout and PDF output need a GUI application; no display is required
int main(int argc, char **argv) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
