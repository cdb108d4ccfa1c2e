#pragma once

// Core wait engine. The WebDriver probe lives in "waitxx/webdriver.hpp" and is
// included separately since it pulls in cpr and nlohmann::json.
#include "waitxx/clock.hpp"
#include "waitxx/condition.hpp"
#include "waitxx/config.hpp"
#include "waitxx/engine.hpp"
#include "waitxx/errors.hpp"
#include "waitxx/expected.hpp"
#include "waitxx/locator.hpp"
#include "waitxx/logger.hpp"
#include "waitxx/outcome.hpp"
#include "waitxx/waitspec.hpp"
