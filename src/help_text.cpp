#include "help_text.hpp"
#include <iomanip>
#include <string>
#include <ostream>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
};

void print_usage(const char* prog, std::ostream& out) {
    out << "Usage: " << prog << " <url> <secret> <hook_id> <sha> [options]\n";
}

void print_help(const char* prog, std::ostream& out) {
    static const std::vector<OptionInfo> opts = {
        {"--ref", "", "<ref>", "Git ref (default: refs/heads/main)"},
        {"--repository", "", "<repo>", "Repository name (default: org/repo)"},
        {"--sender", "", "<name>", "Sender username (default: github-actions)"},
        {"--workflow-run-id", "", "<id>", "Workflow run ID (default: \"\")"},
        {"--timeout", "", "<sec>", "Request timeout in seconds (default: 30)"},
        {"--proxy", "", "<url>", "HTTP proxy for the request"},
        {"--dry-run", "", "", "Print the signed payload without sending it"},
        {"--config-yaml", "", "<file>", "Load option defaults from YAML file"},
        {"--config-json", "", "<file>", "Load option defaults from JSON file"},
        {"--log-file", "", "<file>", "Append delivery log to file"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR"},
        {"--json-log", "", "", "Write log entries as JSON"},
        {"--max-log-size", "", "<bytes>", "Rotate log file above this size"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default: 3)"},
        {"--compress-logs", "", "", "Gzip rotated log files"},
        {"--help", "-h", "", "Show this help"},
        {"--version", "-V", "", "Print program version and exit"},
    };
    out << "Send a signed webhook to trigger deployments\n\n";
    print_usage(prog, out);
    out << "\nArguments:\n"
        << "  url       Webhook URL to send to\n"
        << "  secret    HMAC secret for signing\n"
        << "  hook_id   Hook identifier (e.g., deploy-staging, deploy-production)\n"
        << "  sha       Git SHA to deploy\n\nOptions:\n";
    for (const auto& o : opts) {
        std::string flag = o.long_flag;
        if (*o.short_flag)
            flag = std::string(o.short_flag) + ", " + flag;
        if (*o.arg)
            flag += std::string(" ") + o.arg;
        out << "  " << std::left << std::setw(30) << flag << o.desc << "\n";
    }
    out << "\nExample:\n  " << prog
        << " https://example.com/webhook secret123 deploy-staging abc1234567890\n";
}
