#include "face_recognition_service.h"
#include "image_ops.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace gymface {

namespace {

constexpr size_t AUTH_SEARCH_LIMIT = 5;

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

// Converts an exception into the result fields. Categorized errors keep their
// message; anything else is prefixed with the operation's failure label.
void fail(OperationResult& result, const std::exception& e, const std::string& failure_label) {
    result.success = false;

    if (const auto* fe = dynamic_cast<const FaceError*>(&e)) {
        result.error_kind = fe->kind();
        if (fe->kind() == ErrorKind::Unexpected) {
            result.error = failure_label + ": " + fe->what();
        } else {
            result.error = fe->what();
        }
        return;
    }

    result.error_kind = ErrorKind::Unexpected;
    result.error = failure_label + ": " + e.what();
}

void checkTolerance(const std::optional<double>& tolerance) {
    if (tolerance && !std::isfinite(*tolerance)) {
        throw FaceError(ErrorKind::InputValidation, "Tolerance must be a finite number");
    }
}

} // namespace

FaceRecognitionService::FaceRecognitionService(const Settings& settings,
                                               std::shared_ptr<const FaceModel> model,
                                               std::shared_ptr<BiometricStore> store,
                                               std::shared_ptr<SubjectDirectory> subjects)
    : settings_(settings),
      decoder_(settings.image),
      liveness_(settings.anti_spoofing),
      extractor_(std::move(model), settings.recognition.embedding_dimensions),
      validator_(settings.validation),
      comparator_(settings.recognition.embedding_dimensions, settings.recognition.tolerance),
      quality_(settings.validation.min_face_size_ratio),
      store_(std::move(store)),
      subjects_(std::move(subjects)) {
    if (!store_ || !subjects_) {
        throw std::invalid_argument("FaceRecognitionService requires a biometric store and a subject directory");
    }
}

void FaceRecognitionService::requireActiveSubject(const std::string& subject_id) const {
    std::optional<SubjectInfo> subject = subjects_->find(subject_id);
    if (!subject) {
        Logger::getInstance().warning("Subject not found: " + subject_id);
        throw FaceError(ErrorKind::NotFound, ERROR_SUBJECT_NOT_FOUND);
    }
    if (!subject->is_active) {
        Logger::getInstance().warning("Subject is not active: " + subject_id);
        throw FaceError(ErrorKind::InputValidation, ERROR_SUBJECT_INACTIVE);
    }
}

Bytes FaceRecognitionService::makeThumbnailJpeg(const ImageView& image) const {
    Image thumb = makeThumbnail(image, settings_.image.thumbnail_width, settings_.image.thumbnail_height);
    return encodeJpeg(thumb.view(), settings_.image.thumbnail_quality);
}

RegistrationResult FaceRecognitionService::enroll(const std::string& subject_id, const std::string& image_base64,
                                                  const std::string& operation) {
    RegistrationResult result;
    result.subject_id = subject_id;

    Logger& logger = Logger::getInstance();
    logger.auditAttempt(subject_id, operation);
    auto start = std::chrono::steady_clock::now();

    try {
        if (subject_id.empty()) {
            throw FaceError(ErrorKind::InputValidation, "Subject id must not be empty");
        }
        requireActiveSubject(subject_id);

        DecodedImage decoded = decoder_.decode(image_base64);
        ImageView view = decoded.pixels.view();

        LivenessVerdict verdict = liveness_.checkLiveness(view);
        if (!verdict.is_live) {
            throw FaceError(ErrorKind::SpoofRejection, verdict.reason);
        }

        FaceDetection face = extractor_.extractSingle(view);

        FaceValidationResult validation = validator_.validate(face, view.width(), view.height());
        if (!validation.is_valid) {
            throw FaceError(ErrorKind::QualityRejection, validation.reason);
        }

        Bytes thumbnail = makeThumbnailJpeg(view);
        result.record_id = store_->store(subject_id, face.embedding, thumbnail, extractor_.model().modelName());
        result.success = true;

        logger.auditSuccess(subject_id, operation, elapsedMs(start));
    } catch (const std::exception& e) {
        fail(result, e, "Registration failed");
        if (result.error_kind == ErrorKind::Unexpected) {
            logger.error("Unexpected error during " + operation + " for subject " + subject_id + ": " + e.what());
        }
        logger.auditFailure(subject_id, operation, result.error);
    }

    return result;
}

RegistrationResult FaceRecognitionService::registerFace(const std::string& subject_id, const std::string& image_base64) {
    Logger::getInstance().info("Registering face biometric for subject " + subject_id);
    return enroll(subject_id, image_base64, "register");
}

RegistrationResult FaceRecognitionService::updateFace(const std::string& subject_id, const std::string& image_base64) {
    Logger::getInstance().info("Updating face biometric for subject " + subject_id);
    return enroll(subject_id, image_base64, "update");
}

AuthenticationResult FaceRecognitionService::authenticate(const std::string& image_base64, std::optional<double> tolerance) {
    AuthenticationResult result;

    Logger& logger = Logger::getInstance();
    logger.auditAttempt("unknown", "authenticate");
    auto start = std::chrono::steady_clock::now();

    try {
        checkTolerance(tolerance);
        const double threshold = tolerance.value_or(settings_.recognition.tolerance);

        DecodedImage decoded = decoder_.decode(image_base64);
        FaceDetection face = extractor_.extractSingle(decoded.pixels.view());

        logger.debug("Searching for similar faces with tolerance " + std::to_string(threshold));
        std::vector<SimilarityMatch> matches = store_->searchSimilar(face.embedding, AUTH_SEARCH_LIMIT, threshold);
        if (matches.empty()) {
            throw FaceError(ErrorKind::NotFound, ERROR_NO_MATCHING_FACE);
        }

        const SimilarityMatch& best = matches.front();
        logger.debug("Best match: subject=" + best.record.subject_id +
            " similarity=" + std::to_string(best.similarity));

        std::optional<SubjectInfo> subject = subjects_->find(best.record.subject_id);
        if (!subject || !subject->is_active) {
            logger.warning("Subject " + best.record.subject_id + " not found or inactive");
            throw FaceError(ErrorKind::NotFound, ERROR_NO_MATCHING_FACE);
        }

        result.success = true;
        result.subject_id = best.record.subject_id;
        result.subject = std::move(subject);
        result.similarity = best.similarity;
        result.distance = best.distance;

        logger.auditSuccess(result.subject_id, "authenticate", elapsedMs(start));
    } catch (const std::exception& e) {
        fail(result, e, "Authentication failed");
        if (result.error_kind == ErrorKind::Unexpected) {
            logger.error(std::string("Unexpected error during authentication: ") + e.what());
        }
        logger.auditFailure("unknown", "authenticate", result.error);
    }

    return result;
}

DeletionResult FaceRecognitionService::deleteFace(const std::string& subject_id) {
    DeletionResult result;

    Logger& logger = Logger::getInstance();
    logger.auditAttempt(subject_id, "delete");
    auto start = std::chrono::steady_clock::now();

    try {
        result.deactivated = store_->deactivate(subject_id);
        result.success = true;
        result.message = FACE_DEACTIVATED_MESSAGE;
        logger.auditSuccess(subject_id, "delete", elapsedMs(start));
    } catch (const std::exception& e) {
        fail(result, e, "Deletion failed");
        logger.auditFailure(subject_id, "delete", result.error);
    }

    return result;
}

FaceComparisonResult FaceRecognitionService::compareTwo(const std::string& image_a, const std::string& image_b,
                                                        std::optional<double> tolerance) {
    FaceComparisonResult result;

    try {
        checkTolerance(tolerance);

        DecodedImage decoded_a = decoder_.decode(image_a);
        FaceDetection face_a = extractor_.extractSingle(decoded_a.pixels.view());

        DecodedImage decoded_b = decoder_.decode(image_b);
        FaceDetection face_b = extractor_.extractSingle(decoded_b.pixels.view());

        ComparisonResult cmp = comparator_.compare(face_a.embedding, face_b.embedding, tolerance);

        result.success = true;
        result.match = cmp.is_match;
        result.similarity = cmp.similarity;
        result.distance = 1.0 - cmp.similarity;
        result.confidence = std::max(0.0, cmp.similarity);

        Logger::getInstance().debug("Face comparison result: match=" + std::string(result.match ? "true" : "false") +
            " similarity=" + std::to_string(cmp.similarity));
    } catch (const std::exception& e) {
        fail(result, e, "Comparison failed");
        Logger::getInstance().warning("Face comparison failed: " + result.error);
    }

    return result;
}

QualityAssessmentResult FaceRecognitionService::assessQuality(const std::string& image_base64) {
    QualityAssessmentResult result;

    try {
        DecodedImage decoded = decoder_.decode(image_base64);
        ImageView view = decoded.pixels.view();
        FaceDetection face = extractor_.extractSingle(view);
        result.report = quality_.assess(view, face);
        result.success = true;
    } catch (const std::exception& e) {
        fail(result, e, "Quality assessment failed");
    }

    return result;
}

DetectionResult FaceRecognitionService::detectAll(const std::string& image_base64) {
    DetectionResult result;

    try {
        DecodedImage decoded = decoder_.decode(image_base64);
        result.faces = extractor_.extractAll(decoded.pixels.view());
        result.success = true;
    } catch (const std::exception& e) {
        fail(result, e, "Detection failed");
    }

    return result;
}

} // namespace gymface
