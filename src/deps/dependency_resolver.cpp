#include "deps/dependency_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

#include "deps/python_imports.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace safexec::deps {
namespace {

// Checks whether a top-level module is importable without running any of it.
constexpr const char* kFindSpec =
    "import importlib.util, sys; sys.path.append(sys.argv[2]); "
    "sys.exit(0 if importlib.util.find_spec(sys.argv[1]) else 1)";

// Only index requirements: local paths and archives would run workspace code
// while the network is up.
bool IsRequirementToken(const std::string& token) {
    if (token.empty() || token.front() == '-' || token.front() == '.' ||
        token.find("..") != std::string::npos) {
        return false;
    }
    for (const char* suffix : {".whl", ".zip", ".tar.gz", ".tgz", ".tar.bz2"}) {
        if (utils::EndsWith(token, suffix)) {
            return false;
        }
    }
    return std::all_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '[' || c == ']' ||
               c == ',' || c == '<' || c == '>' || c == '=' || c == '!' || c == '~';
    });
}

std::string StripQuotes(const std::string& token) {
    if (token.size() >= 2 && (token.front() == '"' || token.front() == '\'') &&
        token.back() == token.front()) {
        return token.substr(1, token.size() - 2);
    }
    return token;
}

std::vector<std::string> ExplicitRequirements(const std::string& snippet) {
    static const std::regex kPipInstall(R"(pip3?\s+install\s+([^\n#;&|`$()]+))");
    std::vector<std::string> requirements;
    for (auto it = std::sregex_iterator(snippet.begin(), snippet.end(), kPipInstall);
         it != std::sregex_iterator();
         ++it) {
        std::istringstream words((*it)[1].str());
        std::string word;
        while (words >> word) {
            word = StripQuotes(word);
            if (word.empty() || word.front() == '-') {
                continue;
            }
            if (!IsRequirementToken(word)) {
                utils::LogWarn("deps", "skipping unsafe install argument", {{"argument", word}});
                continue;
            }
            requirements.push_back(word);
        }
    }
    return requirements;
}

}  // namespace

std::string RequirementName(const std::string& requirement) {
    std::string name;
    for (const char c : requirement) {
        if (c == '[' || c == '<' || c == '>' || c == '=' || c == '!' || c == '~' || c == ',') {
            break;
        }
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

const std::unordered_map<std::string, std::string>& DependencyResolver::DefaultAliases() {
    static const std::unordered_map<std::string, std::string> kAliases = {
        {"cv2", "opencv-python"},
        {"cv", "opencv-python"},
        {"PIL", "pillow"},
        {"sklearn", "scikit-learn"},
        {"skimage", "scikit-image"},
        {"yaml", "pyyaml"},
        {"bs4", "beautifulsoup4"},
        {"dateutil", "python-dateutil"},
        {"dotenv", "python-dotenv"},
        {"jose", "python-jose"},
        {"magic", "python-magic"},
        {"docx", "python-docx"},
        {"pptx", "python-pptx"},
        {"Bio", "biopython"},
        {"telegram", "python-telegram-bot"},
        {"serial", "pyserial"},
        {"usb", "pyusb"},
        {"Crypto", "pycryptodome"},
        {"OpenSSL", "pyopenssl"},
        {"jwt", "pyjwt"},
        {"wx", "wxpython"},
        {"gi", "pygobject"},
        {"fitz", "pymupdf"},
        {"lxml", "lxml"},
        {"openpyxl", "openpyxl"},
        {"xlrd", "xlrd"},
        {"xlsxwriter", "xlsxwriter"}
    };
    return kAliases;
}

DependencyResolver::DependencyResolver()
    : aliases_(DefaultAliases()) {}

DependencyResolver::DependencyResolver(std::unordered_map<std::string, std::string> aliases)
    : aliases_(std::move(aliases)) {}

std::string DependencyResolver::PackageFor(const std::string& module) const {
    auto it = aliases_.find(module);
    return it == aliases_.end() ? module : it->second;
}

std::vector<InstallDirective> DependencyResolver::Resolve(const std::string& snippet) const {
    std::vector<InstallDirective> directives;
    std::vector<std::string> seen_packages;
    auto claim = [&seen_packages](const std::string& requirement) {
        const auto name = RequirementName(requirement);
        if (std::find(seen_packages.begin(), seen_packages.end(), name) != seen_packages.end()) {
            return false;
        }
        seen_packages.push_back(name);
        return true;
    };

    for (const auto& requirement : ExplicitRequirements(snippet)) {
        if (claim(requirement)) {
            directives.push_back(InstallDirective{DirectiveSource::kExplicit, "", requirement});
        }
    }

    const auto code = ExtractFencedCode(snippet);
    std::vector<std::string> modules;
    try {
        modules = ParseImports(code);
    } catch (const ImportParseError& ex) {
        utils::LogDebug("deps", "structural parse failed, scanning lines", {{"error", ex.what()}});
        modules = ScanImportLines(code);
    }

    for (const auto& module : modules) {
        const auto package = PackageFor(module);
        if (claim(package)) {
            directives.push_back(InstallDirective{DirectiveSource::kImport, module, package});
        }
    }
    return directives;
}

std::string RenderInstallScript(const std::vector<InstallDirective>& directives,
                                const std::string& python,
                                const std::string& target_dir) {
    std::ostringstream script;
    const auto target = utils::ShellQuote(target_dir);
    const auto pip = utils::ShellQuote(python) +
                     " -I -m pip install --isolated -q --disable-pip-version-check --no-cache-dir"
                     " --retries 0 --timeout 15 --target " +
                     target + " ";
    for (const auto& directive : directives) {
        const auto package = utils::ShellQuote(directive.package);
        const auto failure = "{ echo " + utils::ShellQuote("safexec-install-failed: " + directive.package) +
                             " >&2; true; }";
        if (directive.source == DirectiveSource::kExplicit) {
            script << pip << package << " >/dev/null 2>&1 || " << failure << "\n";
        } else {
            script << utils::ShellQuote(python) << " -I -c " << utils::ShellQuote(kFindSpec) << " "
                   << utils::ShellQuote(directive.module) << " " << target << " >/dev/null 2>&1 || "
                   << pip << package << " >/dev/null 2>&1 || " << failure << "\n";
        }
    }
    return script.str();
}

}  // namespace safexec::deps
