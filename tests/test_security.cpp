#include "test_framework.hpp"

#include "hostgate/security/command_policy.hpp"
#include "hostgate/security/path_policy.hpp"
#include "hostgate/security/secrets.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <fstream>

void register_security_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;
  namespace security = hostgate::security;

  tests.push_back({"command_policy_denies_destructive_commands", [] {
                     const auto format = security::evaluate_command("cmd.exe", "/c format C: /y");
                     require(!format.allowed && format.reason.has_value(), "format denied");
                     require(format.reason->find("Dangerous command pattern") != std::string::npos,
                             "format reason: " + format.reason.value_or(""));

                     require(!security::evaluate_command("cmd.exe", "/c reg delete HKLM\\Software /f")
                                  .allowed,
                             "reg delete denied");
                     require(!security::evaluate_command("cmd.exe", "/c del /f /q C:\\Users\\me\\*")
                                  .allowed,
                             "forced delete denied");
                     require(!security::evaluate_command("/bin/bash", "-c 'rm -rf /'").allowed,
                             "rm -rf / denied");
                   }});

  tests.push_back({"command_policy_blocks_executables_by_name", [] {
                     const auto regedit =
                         security::evaluate_command("C:\\Windows\\regedit.exe", "");
                     require(!regedit.allowed, "regedit denied");
                     require(regedit.reason->find("Blocked executable: 'regedit.exe'") !=
                                 std::string::npos,
                             "reason names the executable");
                     require(!security::evaluate_command("/sbin/mkfs.ext4", "/dev/sdb1").allowed,
                             "mkfs prefix denied");
                     require(security::executable_name("C:/Tools\\App.EXE") == "app.exe",
                             "mixed separators and case");
                   }});

  tests.push_back({"command_policy_shell_operation_list", [] {
                     const auto shell = security::evaluate_command("bash", "-c 'chmod 777 notes'");
                     require(!shell.allowed, "shell host with chmod denied");
                     require(shell.reason->find("dangerous shell operation") != std::string::npos,
                             "reason: " + shell.reason.value_or(""));
                     require(security::evaluate_command("python3", "-c 'chmod 777 notes'").allowed,
                             "non-shell host is not checked against the shell list");
                   }});

  tests.push_back({"command_policy_denies_oversized_command_lines", [] {
                     const auto huge =
                         security::evaluate_command("cmd.exe", "/c echo " + std::string(200000, 'a'));
                     require(!huge.allowed, "200 KB of arguments denied");
                     require(huge.reason->find("longer than 8191 characters") != std::string::npos,
                             "reason: " + huge.reason.value_or(""));
                     require(!security::evaluate_command("notepad.exe", std::string(120000, 'x'))
                                  .allowed,
                             "cap applies to every executable");

                     const std::string prefix = "cmd.exe /c echo ";
                     const auto at_limit = security::evaluate_command(
                         "cmd.exe",
                         "/c echo " + std::string(security::kMaxCommandLineLength - prefix.size(), 'a'));
                     require(at_limit.allowed, "exactly at the limit is still evaluated");
                     const auto dangerous_tail = security::evaluate_command(
                         "cmd.exe", "/c " + std::string(8000, ' ') + "format C:");
                     require(!dangerous_tail.allowed, "signature found after long padding");
                   }});

  tests.push_back({"command_policy_allows_benign_and_is_deterministic", [] {
                     require(security::evaluate_command("notepad.exe", "notes.txt").allowed,
                             "notepad allowed");
                     require(security::evaluate_command("/usr/bin/ls", "-la").allowed, "ls allowed");
                     require(security::evaluate_command("bash", "-c 'echo hello'").allowed,
                             "harmless shell allowed");
                     const auto first = security::evaluate_command("cmd.exe", "/c diskpart");
                     for (int i = 0; i < 5; ++i) {
                       const auto again = security::evaluate_command("cmd.exe", "/c diskpart");
                       require(again.allowed == first.allowed && again.reason == first.reason,
                               "evaluation must be deterministic");
                     }
                   }});

  tests.push_back({"path_policy_blocks_system_roots", [] {
                     require(security::is_blocked_path("C:\\Windows\\System32\\x.txt"),
                             "windows dir");
                     require(security::is_blocked_path("c:/program files/app/cfg.ini"),
                             "case and separators folded");
                     require(security::is_blocked_path("/etc/passwd"), "etc");
                     require(security::is_blocked_path("/usr/../etc/hosts"), "normalized");
                     require(security::is_blocked_path("   "), "blank path");
                     require(!security::is_blocked_path("/etcetera/file"), "sibling prefix allowed");

                     const auto decision = security::check_path_access("/proc/1/mem");
                     require(!decision.allowed &&
                                 decision.reason->find("disallowed system path") != std::string::npos,
                             "reason text");
                   }});

  tests.push_back({"path_policy_workspace_allowed", [] {
                     hostgate::testing::TempWorkspace ws;
                     const auto file = ws.create_file("a.txt", "x");
                     require(security::check_path_access(file.string()).allowed, "temp file");
                   }});

  tests.push_back({"path_policy_size_limits", [] {
                     hostgate::testing::TempWorkspace ws;
                     const auto big = ws.path() / "big.bin";
                     {
                       std::ofstream out(big, std::ios::binary);
                       out.seekp(static_cast<std::streamoff>(security::kMaxFileBytes));
                       out.put('x');
                     }
                     const auto denied = security::check_read_size(big);
                     require(!denied.allowed, "file over limit");
                     require(denied.reason->find("10 MB size limit") != std::string::npos,
                             "reason: " + denied.reason.value_or(""));
                     require(security::check_read_size(ws.path() / "missing").allowed,
                             "missing file passes");
                     require(security::check_content_size(security::kMaxFileBytes, "x").allowed,
                             "exactly at the limit");
                     require(!security::check_content_size(security::kMaxFileBytes + 1, "x").allowed,
                             "one byte over");
                   }});

  tests.push_back({"secrets_base64", [] {
                     require(security::base64_encode("hello") == "aGVsbG8=", "encode");
                     const auto decoded = security::base64_decode("aGVsbG8=");
                     require(decoded.ok() && decoded.value() == "hello", "decode");
                     require(!security::base64_decode("@@@").ok(), "invalid input rejected");
                   }});

  tests.push_back({"secrets_encrypt_decrypt", [] {
                     const auto key = security::generate_key();
                     require(key.ok(), key.error());
                     const auto blob = security::encrypt_secret(key.value(), "s3cret");
                     require(blob.ok(), blob.error());
                     require(blob.value().find("s3cret") == std::string::npos, "ciphertext opaque");
                     const auto plain = security::decrypt_secret(key.value(), blob.value());
                     require(plain.ok() && plain.value() == "s3cret", "roundtrip");

                     std::string tampered = blob.value();
                     tampered[tampered.size() / 2] ^= 0x01;
                     require(!security::decrypt_secret(key.value(), tampered).ok(),
                             "tampered blob rejected");
                   }});

  tests.push_back({"secrets_key_file_created_once", [] {
                     hostgate::testing::TempWorkspace ws;
                     const auto path = ws.path() / "keys" / "secrets.key";
                     const auto first = security::load_or_create_key(path);
                     const auto second = security::load_or_create_key(path);
                     require(first.ok() && second.ok(), "key load");
                     require(first.value() == second.value(), "same key on reload");
                     require((std::filesystem::status(path).permissions() &
                              std::filesystem::perms::group_all) == std::filesystem::perms::none,
                             "key file not group readable");
                   }});
}
