#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "locator.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Note: Braced init doesn't work well, use `= init`
using json = nlohmann::json;

namespace waitxx::webdriver {

    const cpr::Header HEADER_ACC_RECV_JSON {{"Content-Type", "application/json"}, {"Accept", "application/json"}};

    enum BROWSERS {MSEDGE, CHROME, FIREFOX};

    // Any error reported by the remote end that has no dedicated type
    class WebDriverError: public std::runtime_error {
        private:
            std::string code_;
            long status_;

        public:
            WebDriverError(const std::string &code, const std::string &message, long status):
                std::runtime_error(code + ": " + message), code_(code), status_(status) {}

            const std::string &code() const noexcept { return code_; }
            long status() const noexcept { return status_; }
    };

    class NoSuchElementError: public NotFoundError {
        public:
            explicit NoSuchElementError(const std::string &message):
                NotFoundError("no such element: " + message) {}
    };

    inline BROWSERS resolveBrowser(const std::string &browserName) {
        if (browserName == "firefox") return BROWSERS::FIREFOX;
        else if (browserName == "chrome") return BROWSERS::CHROME;
        else if (browserName == "msedge") return BROWSERS::MSEDGE;
        else throw ConfigurationError('`' + browserName + "` is not supported.");
    }

    namespace detail {
        enum class Method {GET, POST, DELETE};

        // Map a W3C error body onto the exception hierarchy, see
        // https://www.w3.org/TR/webdriver2/#errors
        [[noreturn]] inline void raise(const cpr::Response &response) {
            if (response.error)
                throw WebDriverError("transport", response.error.message, response.status_code);

            std::string code {"unknown error"}, message {response.text};
            json body = json::parse(response.text, nullptr, false);
            if (!body.is_discarded() && body.contains("value") && body["value"].is_object()) {
                code = body["value"].value("error", code);
                message = body["value"].value("message", message);
            }

            if (code == "no such element")
                throw NoSuchElementError(message);
            if (code == "stale element reference")
                throw StaleElementReferenceError("stale element reference: " + message);
            throw WebDriverError(code, message, response.status_code);
        }

        // Perform one command and return the `value` member of the reply
        inline json send(Method method, const std::string &url, const json &payload = json::object()) {
            cpr::Response response;
            switch (method) {
                case Method::GET:
                    response = cpr::Get(cpr::Url{url}, HEADER_ACC_RECV_JSON);
                    break;
                case Method::POST:
                    response = cpr::Post(cpr::Url{url}, cpr::Body{payload.dump()}, HEADER_ACC_RECV_JSON);
                    break;
                case Method::DELETE:
                    response = cpr::Delete(cpr::Url{url}, HEADER_ACC_RECV_JSON);
                    break;
            }

            logging::Trace("{} -> HTTP {}", url, response.status_code);
            if (response.error || response.status_code != 200)
                raise(response);

            json body = json::parse(response.text, nullptr, false);
            if (body.is_discarded())
                throw WebDriverError("invalid response", response.text, response.status_code);
            return body.contains("value")? body["value"]: json{};
        }

        inline json locatorPayload(const Locator &locator) {
            return json{{"using", strategyKeyword(locator.strategy)}, {"value", locator.criteria}};
        }
    }

    struct Timeout {
        std::optional<unsigned int> script, pageLoad, implicit;
    };

    class Capabilities {
        private:
            const BROWSERS browserType;
            const std::string binaryPath;

            std::optional<bool> _headless;
            std::optional<bool> _disableGPU;
            std::optional<bool> _startMaximized;
            std::optional<bool> _ignoreCertErrors;

            std::optional<int>  _windowHeight;
            std::optional<int>  _windowWidth;

        public:
            Capabilities(const BROWSERS &browserType, const std::string &binaryPath):
                browserType(browserType), binaryPath(binaryPath) {}

            // Builder pattern for setting capabilities
            Capabilities &headless(bool flag) { _headless = flag; return *this; }
            Capabilities &disableGPU(bool flag) { _disableGPU = flag; return *this; }
            Capabilities &startMaximized(bool flag) { _startMaximized = flag; return *this; }
            Capabilities &ignoreCertErrors(bool flag) { _ignoreCertErrors = flag; return *this; }
            Capabilities &windowSize(int height, int width) { _windowHeight = height; _windowWidth = width; return *this; }

            operator json() const {
                std::string optsId;
                switch (browserType) {
                    case BROWSERS::FIREFOX: optsId = "moz:firefoxOptions"; break;
                    case BROWSERS::CHROME: optsId = "goog:chromeOptions"; break;
                    case BROWSERS::MSEDGE: optsId = "ms:edgeOptions"; break;
                }

                json alwaysMatch = {
                    { optsId, {
                        { "args", json::array() },
                        { "binary", binaryPath }
                    }}
                };

                json &args = alwaysMatch[optsId]["args"];
                if (_headless && *_headless) args.push_back("--headless");
                if (_disableGPU && *_disableGPU) args.push_back("--disable-gpu");
                if (_ignoreCertErrors && *_ignoreCertErrors) alwaysMatch["acceptInsecureCerts"] = true;

                if (_startMaximized && *_startMaximized) {
                    if (browserType == BROWSERS::FIREFOX)
                        logging::Warn("Start maximized is not supported in firefox, ignoring it");
                    else args.push_back("--start-maximized");
                }

                if (_windowHeight && _windowWidth) {
                    if (browserType == BROWSERS::FIREFOX) {
                        args.push_back("--height=" + std::to_string(*_windowHeight));
                        args.push_back("--width=" + std::to_string(*_windowWidth));
                    } else {
                        args.push_back("--window-size=" + std::to_string(*_windowHeight) + ',' + std::to_string(*_windowWidth));
                    }
                }

                json payload = {{"capabilities", {{"alwaysMatch", alwaysMatch}}}};
                return payload;
            }
    };

    class Element {
        private:
            const std::string elementRef, elementId, sessionURL, elementURL;

        public:
            explicit operator bool() const {
                return !elementId.empty();
            }

            operator json() const {
                return json{{elementRef, elementId}};
            }

            Element(const std::string &elementRef, const std::string &elementId, const std::string &sessionURL):
                elementRef(elementRef),
                elementId(elementId),
                sessionURL(sessionURL),
                elementURL(sessionURL + "/element/" + elementId)
            { }

            // Decode a web element reference object {"element-6066-...": "<id>"}
            static Element fromJson(const json &reference, const std::string &sessionURL) {
                if (!reference.is_object() || reference.empty())
                    throw WebDriverError("invalid response", "Not a web element reference: " + reference.dump(), 200);
                return Element{reference.begin().key(), reference.begin().value().get<std::string>(), sessionURL};
            }

            const std::string &id() const noexcept { return elementId; }

            Element &click() {
                detail::send(detail::Method::POST, elementURL + "/click");
                return *this;
            }

            Element &sendKeys(const std::string &text) {
                detail::send(detail::Method::POST, elementURL + "/value", json{{"text", text}});
                return *this;
            }

            Element &clear() {
                detail::send(detail::Method::POST, elementURL + "/clear");
                return *this;
            }

            // Absent attributes come back as nullopt rather than an empty string
            std::optional<std::string> getElementAttribute(const std::string &name) const {
                json value = detail::send(detail::Method::GET, elementURL + "/attribute/" + name);
                if (value.is_null()) return std::nullopt;
                return value.is_string()? value.get<std::string>(): value.dump();
            }

            std::optional<std::string> getElementProperty(const std::string &name) const {
                json value = detail::send(detail::Method::GET, elementURL + "/property/" + name);
                if (value.is_null()) return std::nullopt;
                return value.is_string()? value.get<std::string>(): value.dump();
            }

            std::string getElementText() const {
                return detail::send(detail::Method::GET, elementURL + "/text").get<std::string>();
            }

            std::string getElementTagName() const {
                return detail::send(detail::Method::GET, elementURL + "/name").get<std::string>();
            }

            bool isDisplayed() const {
                return detail::send(detail::Method::GET, elementURL + "/displayed").get<bool>();
            }

            bool isEnabled() const {
                return detail::send(detail::Method::GET, elementURL + "/enabled").get<bool>();
            }

            bool isSelected() const {
                return detail::send(detail::Method::GET, elementURL + "/selected").get<bool>();
            }

            Element findElement(const Locator &locator) const {
                json reference = detail::send(detail::Method::POST, elementURL + "/element", detail::locatorPayload(locator));
                return fromJson(reference, sessionURL);
            }

            std::vector<Element> findElements(const Locator &locator) const {
                json references = detail::send(detail::Method::POST, elementURL + "/elements", detail::locatorPayload(locator));
                std::vector<Element> elements;
                std::transform(references.begin(), references.end(), std::back_inserter(elements),
                    [this](const json &reference) { return fromJson(reference, sessionURL); }
                );
                return elements;
            }
    };

    // One browser session, opened on construction and deleted on destruction
    class Driver {
        private:
            const Capabilities capabilities;
            const std::string port, baseURL;
            const std::string sessionId, sessionURL;
            bool running {false};

            std::string startSession() {
                if (!status())
                    throw WebDriverError("session not created", "Webdriver on port " + port + " is not ready", 0);

                json reply = detail::send(detail::Method::POST, baseURL + "/session", static_cast<json>(capabilities));
                std::string id = reply.at("sessionId");
                logging::Info("Started webdriver session {} on port {}", id, port);
                return id;
            }

        public:
            Driver(
                const Capabilities &cap_,
                const std::string  &port_,
                const std::string  &sessionId_  = ""
            ):
                capabilities(cap_), port(port_),
                baseURL("http://127.0.0.1:" + port),
                sessionId(sessionId_.empty()? startSession(): sessionId_),
                sessionURL(baseURL + "/session/" + sessionId)
            { running = true; }

            explicit Driver(const config::SessionSettings &settings):
                Driver(
                    Capabilities{resolveBrowser(settings.browser), settings.binary}.headless(settings.headless),
                    settings.port
                ) {}

            Driver(const Driver&) = delete;
            Driver &operator=(const Driver&) = delete;

            ~Driver() { if (running) quit(); }

            bool status() const {
                cpr::Response response {cpr::Get(cpr::Url(baseURL + "/status"), HEADER_ACC_RECV_JSON)};
                if (response.status_code != 200) return false;
                json body = json::parse(response.text, nullptr, false);
                return !body.is_discarded() && body.contains("value") && body["value"].is_object()
                    && body["value"].value("ready", false);
            }

            // Best effort, a session that is already gone is not an error here
            void quit() {
                cpr::Response response {cpr::Delete(cpr::Url(sessionURL), HEADER_ACC_RECV_JSON)};
                if (response.status_code != 200)
                    logging::Warn("Deleting session {} returned HTTP {}", sessionId, response.status_code);
                running = false;
            }

            Driver &navigateTo(const std::string &url) {
                detail::send(detail::Method::POST, sessionURL + "/url", json{{"url", url}});
                return *this;
            }

            Driver &back() {
                detail::send(detail::Method::POST, sessionURL + "/back");
                return *this;
            }

            Driver &forward() {
                detail::send(detail::Method::POST, sessionURL + "/forward");
                return *this;
            }

            Driver &refresh() {
                detail::send(detail::Method::POST, sessionURL + "/refresh");
                return *this;
            }

            Timeout getTimeouts() const {
                json timeouts = detail::send(detail::Method::GET, sessionURL + "/timeouts");
                Timeout result;
                if (timeouts.value("script", json{}).is_number()) result.script = timeouts["script"].get<unsigned int>();
                if (timeouts.value("pageLoad", json{}).is_number()) result.pageLoad = timeouts["pageLoad"].get<unsigned int>();
                if (timeouts.value("implicit", json{}).is_number()) result.implicit = timeouts["implicit"].get<unsigned int>();
                return result;
            }

            // Session wide waits, applied by the remote end to every command
            Driver &setTimeouts(const Timeout &timeouts) {
                if (!timeouts.script && !timeouts.pageLoad && !timeouts.implicit)
                    throw ConfigurationError("Atleast one timeout must be set.");

                json payload = json::object();
                if (timeouts.script) payload["script"] = *timeouts.script;
                if (timeouts.pageLoad) payload["pageLoad"] = *timeouts.pageLoad;
                if (timeouts.implicit) payload["implicit"] = *timeouts.implicit;

                detail::send(detail::Method::POST, sessionURL + "/timeouts", payload);
                return *this;
            }

            std::string getCurrentURL() const {
                return detail::send(detail::Method::GET, sessionURL + "/url").get<std::string>();
            }

            std::string getTitle() const {
                return detail::send(detail::Method::GET, sessionURL + "/title").get<std::string>();
            }

            std::string getPageSource() const {
                return detail::send(detail::Method::GET, sessionURL + "/source").get<std::string>();
            }

            Element findElement(const Locator &locator) const {
                json reference = detail::send(detail::Method::POST, sessionURL + "/element", detail::locatorPayload(locator));
                return Element::fromJson(reference, sessionURL);
            }

            std::vector<Element> findElements(const Locator &locator) const {
                json references = detail::send(detail::Method::POST, sessionURL + "/elements", detail::locatorPayload(locator));
                std::vector<Element> elements;
                std::transform(references.begin(), references.end(), std::back_inserter(elements),
                    [this](const json &reference) { return Element::fromJson(reference, sessionURL); }
                );
                return elements;
            }

            template<typename T>
            T execute(const std::string &code, const json &args = json::array()) {
                json payload = {{ "script", code }, { "args", args.is_array()? args: json::array({args}) }};
                return detail::send(detail::Method::POST, sessionURL + "/execute/sync", payload).get<T>();
            }
    };
}
