// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/WebEngineSurface.hpp"

#include "shell/ShellConstants.hpp"

#include <QtCore/QFile>
#include <QtWebChannel/QWebChannel>
#include <QtWebEngineCore/QWebEnginePage>
#include <QtWebEngineCore/QWebEngineScript>
#include <QtWebEngineCore/QWebEngineScriptCollection>
#include <QtWebEngineWidgets/QWebEngineView>

namespace Shell {

namespace {

// Wraps every registered channel object into window.plutoShell.invoke(name, args) -> Promise.
// Results of the form {ok: false, error} reject with that error.
constexpr char kBridgeBootstrapJs[] = R"JS(
(function () {
  if (window.plutoShell || typeof QWebChannel === 'undefined' || !window.qt) {
    return;
  }
  var ready = new Promise(function (resolve) {
    new QWebChannel(qt.webChannelTransport, function (channel) {
      resolve(channel.objects);
    });
  });
  window.plutoShell = {
    invoke: function (name, args) {
      return ready.then(function (objects) {
        return new Promise(function (resolve, reject) {
          var target = null;
          Object.keys(objects).forEach(function (key) {
            if (!target && typeof objects[key][name] === 'function') {
              target = objects[key];
            }
          });
          if (!target) {
            reject(new Error('Unknown command: ' + name));
            return;
          }
          var values = Array.isArray(args) ? args.slice()
            : (args && typeof args === 'object') ? Object.keys(args).map(function (k) { return args[k]; })
            : (args === undefined ? [] : [args]);
          values.push(function (result) {
            if (result && result.ok === false) {
              reject(new Error(result.error));
            } else {
              resolve(result);
            }
          });
          target[name].apply(target, values);
        });
      });
    }
  };
})();
)JS";

QString loadQWebChannelJs()
{
	QFile file(QString::fromLatin1(Constants::QWEBCHANNEL_JS_RESOURCE));
	if (!file.open(QIODevice::ReadOnly)) {
		qCWarning(shelllog) << "qwebchannel.js unavailable:" << file.errorString();
		return {};
	}
	return QString::fromUtf8(file.readAll());
}

} // namespace

WebEngineSurface::WebEngineSurface(QWidget* parent)
	: m_view(new QWebEngineView(parent))
{
	m_channel = new QWebChannel(m_view);
	m_view->page()->setWebChannel(m_channel);
	installBridgeScript();
}

WebEngineSurface::~WebEngineSurface() = default;

WebSurfaceFactory WebEngineSurface::factory()
{
	return [](QWidget* parent) -> std::unique_ptr<WebSurface> {
		return std::make_unique<WebEngineSurface>(parent);
	};
}

QWidget* WebEngineSurface::widget() const
{
	return m_view;
}

void WebEngineSurface::load(const QUrl& url)
{
	if (m_view)
		m_view->setUrl(url);
}

QUrl WebEngineSurface::url() const
{
	return m_view ? m_view->url() : QUrl();
}

void WebEngineSurface::runJavaScript(const QString& script)
{
	if (m_view)
		m_view->page()->runJavaScript(script);
}

void WebEngineSurface::registerObject(const QString& name, QObject* object)
{
	if (m_channel)
		m_channel->registerObject(name, object);
}

void WebEngineSurface::installBridgeScript()
{
	const QString channelJs = loadQWebChannelJs();
	if (channelJs.isEmpty())
		return;

	QWebEngineScript script;
	script.setName(QStringLiteral("plutoShell.bridge"));
	script.setInjectionPoint(QWebEngineScript::DocumentCreation);
	script.setWorldId(QWebEngineScript::MainWorld);
	script.setRunsOnSubFrames(false);
	script.setSourceCode(channelJs + QString::fromUtf8(kBridgeBootstrapJs));
	m_view->page()->scripts().insert(script);
}

} // namespace Shell
