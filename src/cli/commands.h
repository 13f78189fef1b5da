#ifndef GYMFACE_CLI_COMMANDS_H
#define GYMFACE_CLI_COMMANDS_H

#include <optional>
#include <string>

namespace gymface {

/**
 * Command Functions for the gymface CLI
 *
 * Every command prints a JSON result to stdout and returns:
 *   - 0 on success
 *   - 1 on failure
 *
 * config_path is the value of --config (empty for CONFIG_DIR/gymface.conf).
 */

/**
 * Enroll a face for a subject (liveness, single-face detection, validation, store)
 *
 * @param subject_id Subject to enroll
 * @param image_path Path to a jpg/png/webp image
 * @param update     If true, run as "update" (same pipeline, audited separately)
 */
int cmd_register(const std::string& config_path, const std::string& subject_id,
                 const std::string& image_path, bool update = false);

/**
 * Identify the subject in an image
 *
 * @param tolerance Cosine distance cutoff; [recognition] tolerance when not given
 */
int cmd_authenticate(const std::string& config_path, const std::string& image_path,
                     std::optional<double> tolerance = std::nullopt);

/**
 * Deactivate the subject's face biometric
 */
int cmd_delete(const std::string& config_path, const std::string& subject_id);

/**
 * Compare the single faces of two images
 */
int cmd_compare(const std::string& config_path, const std::string& image_a,
                const std::string& image_b, std::optional<double> tolerance = std::nullopt);

/**
 * List subjects and their active face records
 */
int cmd_list(const std::string& config_path);

/**
 * Detect every face in an image (bounding box, landmarks, age/gender)
 */
int cmd_detect(const std::string& config_path, const std::string& image_path);

/**
 * Report capture quality (size, lighting, sharpness) of the single face in an image
 */
int cmd_quality(const std::string& config_path, const std::string& image_path);

/**
 * Create or rename a subject, marking it active
 */
int cmd_subject_add(const std::string& config_path, const std::string& subject_id,
                    const std::string& display_name);

/**
 * Mark a subject inactive; its faces no longer authenticate
 */
int cmd_subject_disable(const std::string& config_path, const std::string& subject_id);

/**
 * Print usage information and command help
 */
void print_usage();

} // namespace gymface

#endif // GYMFACE_CLI_COMMANDS_H
