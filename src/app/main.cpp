// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QStringList>

#include <QtWidgets/QApplication>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QVBoxLayout>
#include <QtWidgets/QWidget>

#include <memory>

#include "spotlight/SpotlightConfigJson.hpp"
#include "spotlight/SpotlightPlugin.hpp"
#include "spotlight/SpotlightWindowWatcher.hpp"
#include "spotlight/api/ISpotlightManager.hpp"

using namespace Spotlight;

static constexpr char defaultConfigJsonC[] = R"({
	"windows": [
		{ "label": "secondary", "shortcut": "Ctrl+Shift+J", "macos_window_level": 20, "auto_hide": true }
	],
	"global_close_shortcut": "Escape"
})";

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static QWidget* createSpotlightWindow()
{
	auto* window = new QWidget;
	window->setObjectName(QStringLiteral("secondary"));
	window->setWindowTitle(QStringLiteral("Spotlight"));
	window->resize(640, 96);

	auto* layout = new QVBoxLayout(window);
	auto* search = new QLineEdit(window);
	search->setPlaceholderText(QStringLiteral("Search..."));
	layout->addWidget(search);
	return window;
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("spotlight-demo"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Spotlight overlay panel demo"));
	parser.addHelpOption();
	const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
										  QStringLiteral("JSON configuration layered over the built-in defaults."),
										  QStringLiteral("file"));
	parser.addOption(configOption);
	parser.process(app);

	PluginConfig defaults;
	const Utils::Result defaultsResult = parsePluginConfig(QByteArray(defaultConfigJsonC), defaults);
	if (!defaultsResult) {
		printErrorsAndFail("Built-in configuration is invalid.", defaultsResult.errors);
		return EXIT_FAILURE;
	}

	PluginConfig user;
	if (parser.isSet(configOption)) {
		const Utils::Result userResult = loadPluginConfigFile(parser.value(configOption), user);
		if (!userResult) {
			printErrorsAndFail("Failed to load configuration.", userResult.errors);
			return EXIT_FAILURE;
		}
	}

	SpotlightPlugin* plugin = SpotlightPlugin::install(&app, PluginConfig::merge(user, defaults));
	if (!plugin) {
		qCritical().noquote() << "Failed to install the spotlight plugin.";
		return EXIT_FAILURE;
	}
	QObject::connect(plugin->watcher(), &SpotlightWindowWatcher::initializationFailed,
					 [](const QString& label, const QString& message) {
						 qCritical().noquote() << "Spotlight window" << label << "failed:" << message;
					 });

	QMainWindow mainWindow;
	mainWindow.setObjectName(QStringLiteral("main"));
	mainWindow.setWindowTitle(QStringLiteral("Spotlight Demo"));
	mainWindow.setCentralWidget(new QLabel(QStringLiteral("Press Ctrl+Shift+J to open the spotlight panel."),
										   &mainWindow));
	mainWindow.resize(480, 240);
	mainWindow.show();

	const std::unique_ptr<QWidget> spotlightWindow(createSpotlightWindow());
	spotlightWindow->show();
	if (ISpotlightManager* manager = spotlight(&app)) {
		const SpotlightError centered = manager->center(spotlightWindow->objectName());
		if (!centered.ok())
			qWarning().noquote() << centered.message();
	}

	return app.exec();
}
