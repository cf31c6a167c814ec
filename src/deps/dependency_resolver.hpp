#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace safexec::deps {

enum class DirectiveSource {
    kExplicit,
    kImport
};

struct InstallDirective {
    DirectiveSource source = DirectiveSource::kImport;
    // Import name to probe before installing; empty for explicit directives.
    std::string module;
    // Requirement passed to pip, e.g. "pillow" or "numpy==1.26.4".
    std::string package;

    bool operator==(const InstallDirective& other) const {
        return source == other.source && module == other.module && package == other.package;
    }
};

class DependencyResolver {
public:
    DependencyResolver();
    explicit DependencyResolver(std::unordered_map<std::string, std::string> aliases);

    // Explicit "pip install" directives first, verbatim, then one directive per
    // imported module. Deduplicated by package name.
    std::vector<InstallDirective> Resolve(const std::string& snippet) const;

    std::string PackageFor(const std::string& module) const;

    static const std::unordered_map<std::string, std::string>& DefaultAliases();

private:
    std::unordered_map<std::string, std::string> aliases_;
};

// Distribution name of a requirement: "Foo[bar]>=1.0" -> "foo".
std::string RequirementName(const std::string& requirement);

// Shell lines installing each directive into `target_dir`. Every line is
// guarded so one failure neither stops the script nor the later run; a
// failure prints "safexec-install-failed: <package>" to stderr.
std::string RenderInstallScript(const std::vector<InstallDirective>& directives,
                                const std::string& python,
                                const std::string& target_dir);

}  // namespace safexec::deps
