#include "catalyst/rules/rule_loader.h"

namespace catalyst::rules {

namespace {

// Kept in sync with assets/detection-rules.json.
constexpr std::string_view kDefaultRules = R"RULES(
{
  "version": "1.0",
  "rules": [
    {
      "id": "missing-gitignore",
      "kind": "file_absence",
      "target": ".gitignore",
      "confidence": "high",
      "severity": "high",
      "category": "git",
      "title": "Missing .gitignore",
      "recommendation": {
        "template": "git/gitignore-generic",
        "reason": "Prevents committing build output, dependencies and secrets",
        "variants": [
          { "when": { "project_type": "node" }, "template": "git/gitignore-node" },
          { "when": { "project_type": "python" }, "template": "git/gitignore-python" },
          { "when": { "project_type": "java" }, "template": "git/gitignore-java" },
          { "when": { "project_type": "rust" }, "template": "git/gitignore-rust" },
          { "when": { "project_type": "go" }, "template": "git/gitignore-go" }
        ]
      }
    },
    {
      "id": "missing-ci-workflow",
      "kind": "file_absence",
      "target": [
        ".github/workflows/ci.yml",
        ".github/workflows/ci.yaml",
        ".github/workflows/test.yml",
        ".gitlab-ci.yml",
        ".circleci/config.yml",
        "azure-pipelines.yml",
        "Jenkinsfile",
        ".travis.yml"
      ],
      "confidence": "high",
      "severity": "medium",
      "category": "ci_cd",
      "title": "No CI pipeline configured",
      "applies_when": { "flag": "hasCI", "equals": false },
      "recommendation": {
        "template": "ci/github-actions-generic",
        "reason": "Automated checks catch regressions before they are merged",
        "variants": [
          { "when": "package.json exists", "template": "ci/github-actions-node" },
          { "when": "requirements.txt or pyproject.toml exists", "template": "ci/github-actions-python" }
        ]
      }
    },
    {
      "id": "missing-readme",
      "kind": "file_absence",
      "target": ["README.md", "README.rst", "README.txt", "README"],
      "confidence": "high",
      "severity": "high",
      "category": "documentation",
      "title": "Missing README",
      "recommendation": {
        "template": "documentation/README",
        "reason": "The README is the entry point for every new contributor"
      }
    },
    {
      "id": "readme-minimal",
      "kind": "file_quality",
      "target": "README.md",
      "confidence": "medium",
      "severity": "medium",
      "category": "documentation",
      "title": "README is too short or lacks key sections",
      "applies_when": "README.md exists",
      "quality_criteria": {
        "min_lines": 50,
        "required_sections": ["## Installation", "## Usage"]
      },
      "recommendation": {
        "template": "documentation/README",
        "reason": "Installation and usage sections answer the first questions users ask"
      }
    },
    {
      "id": "missing-contributing",
      "kind": "file_absence",
      "target": ["CONTRIBUTING.md", ".github/CONTRIBUTING.md", "docs/CONTRIBUTING.md"],
      "confidence": "high",
      "severity": "low",
      "category": "documentation",
      "title": "Missing contribution guide",
      "recommendation": {
        "template": "documentation/CONTRIBUTING",
        "reason": "Explains how to propose changes and what reviewers expect"
      }
    },
    {
      "id": "missing-license",
      "kind": "file_absence",
      "target": ["LICENSE", "LICENSE.txt", "LICENSE.md"],
      "confidence": "high",
      "severity": "medium",
      "category": "documentation",
      "title": "Missing license",
      "recommendation": {
        "template": "documentation/LICENSE-MIT",
        "reason": "Without a license nobody can legally reuse the code"
      }
    },
    {
      "id": "missing-dockerfile",
      "kind": "file_absence",
      "target": ["Dockerfile", "docker-compose.yml", "compose.yaml"],
      "confidence": "medium",
      "severity": "low",
      "category": "ci_cd",
      "title": "No container definition",
      "recommendation": {
        "template": "ci/Dockerfile-generic",
        "reason": "A container image gives reproducible builds and deployments",
        "variants": [
          { "when": { "project_type": "node" }, "template": "ci/Dockerfile-node" },
          { "when": { "project_type": "python" }, "template": "ci/Dockerfile-python" }
        ]
      }
    },
    {
      "id": "missing-eslint",
      "kind": "file_absence",
      "target": [
        ".eslintrc",
        ".eslintrc.js",
        ".eslintrc.cjs",
        ".eslintrc.json",
        ".eslintrc.yml",
        "eslint.config.js",
        "eslint.config.mjs"
      ],
      "confidence": "high",
      "severity": "medium",
      "category": "code_quality",
      "title": "No ESLint configuration",
      "applies_when": { "project_type": "node" },
      "recommendation": {
        "template": "quality/eslintrc",
        "reason": "Linting enforces consistent style and catches common mistakes",
        "variants": [
          { "when": { "framework": "react" }, "template": "quality/eslintrc-react" }
        ]
      }
    },
    {
      "id": "missing-prettier",
      "kind": "file_absence",
      "target": [".prettierrc", ".prettierrc.json", ".prettierrc.js", "prettier.config.js"],
      "confidence": "medium",
      "severity": "low",
      "category": "code_quality",
      "title": "No Prettier configuration",
      "applies_when": { "project_type": "node" },
      "recommendation": {
        "template": "quality/prettierrc",
        "reason": "Automatic formatting removes style discussions from code review"
      }
    },
    {
      "id": "missing-editorconfig",
      "kind": "file_absence",
      "target": ".editorconfig",
      "confidence": "high",
      "severity": "low",
      "category": "setup",
      "title": "Missing .editorconfig",
      "recommendation": {
        "template": "setup/editorconfig",
        "reason": "Keeps indentation and line endings consistent across editors"
      }
    },
    {
      "id": "missing-env-example",
      "kind": "file_absence",
      "target": [".env.example", ".env.sample", ".env.template"],
      "confidence": "medium",
      "severity": "medium",
      "category": "security",
      "title": "No example environment file",
      "applies_when": {
        "any": [{ "project_type": "node" }, { "project_type": "python" }, { "project_type": "php" }]
      },
      "recommendation": {
        "template": "security/env-example",
        "reason": "Documents required configuration without committing real secrets"
      }
    },
    {
      "id": "missing-security-policy",
      "kind": "file_absence",
      "target": ["SECURITY.md", ".github/SECURITY.md"],
      "confidence": "high",
      "severity": "low",
      "category": "security",
      "title": "Missing security policy",
      "recommendation": {
        "template": "security/SECURITY",
        "reason": "Tells researchers how to report vulnerabilities privately"
      }
    },
    {
      "id": "missing-tests-dir",
      "kind": "directory_absence",
      "target": ["tests", "test", "spec", "__tests__"],
      "confidence": "medium",
      "severity": "high",
      "category": "code_quality",
      "title": "No test directory",
      "applies_when": { "flag": "hasTests", "equals": false },
      "recommendation": {
        "template": "quality/tests-scaffold",
        "reason": "Tests are the only reliable guard against regressions"
      }
    }
  ]
}
)RULES";

}  // namespace

std::string_view default_rule_source() { return kDefaultRules; }

}  // namespace catalyst::rules
