/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ChangelogService.hpp"
#include "application/ReleaseService.hpp"
#include "domain/ChangelogRepository.hpp"
#include "infrastructure/ConfigStore.hpp"

namespace chlog::application {

struct AppServices {
    std::shared_ptr<infrastructure::ConfigStore> config;
    std::shared_ptr<domain::ChangelogRepository> repository;
    std::unique_ptr<ChangelogService> changelogService;
    std::unique_ptr<ReleaseService> releaseService;
};

} // namespace chlog::application
