#include "concord/audit.hpp"
#include "concord/crypto.hpp"
#include "concord/errors.hpp"
#include <iostream>

// This example verifies an exported session audit offline.
// Every agent chain is re-hashed and its signatures checked, then the handshakes
// and co-signed interactions are cross-checked between the logs.
//
// Usage: verify_audit_example [session-audit.json]

int main(int argc, char* argv[]) {
    if (Concord::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    const std::string path = argc > 1 ? argv[1] : "session-audit.json";

    Concord::AuditReport report;
    try {
        report = Concord::AuditVerifier::verify_export_file(path);
    } catch (const Concord::PersistenceError& e) {
        std::cerr << "Cannot read audit: " << e.what() << std::endl;
        return 2;
    }

    std::cout << "Events checked      : " << report.events_checked << std::endl;
    std::cout << "Handshakes checked  : " << report.handshakes_checked << std::endl;
    std::cout << "Interactions checked: " << report.interactions_checked << std::endl;

    if (!report.valid()) {
        std::cerr << "Audit FAILED with " << report.issues.size() << " issue(s):" << std::endl;
        for (const auto& issue : report.issues) {
            std::cerr << "  - " << issue << std::endl;
        }
        return 1;
    }

    std::cout << "Audit OK: " << path << std::endl;
    return 0;
}
