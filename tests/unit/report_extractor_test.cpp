#include "internal/extraction/report_extractor.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/storage/common/arrow_utils.hpp"

namespace {

using namespace std::chrono_literals;

using carelog::extraction::CallOptions;
using carelog::extraction::CancellationToken;
using carelog::extraction::ExtractionService;
using carelog::extraction::ExtractorOptions;
using carelog::extraction::ReportExtractor;
using carelog::model::SourceDocument;
using carelog::model::SourceFormat;
using carelog::storage::common::BufferFromString;
using carelog::util::Status;
using carelog::util::StatusCode;
using carelog::util::StatusOr;

namespace v1 = carelog::v1;

const carelog::util::Day kDay{std::chrono::year{2026} / 3 / 14};

/*
  Scripted extraction service. In blocking mode ExtractEvents waits for the
  caller's cancellation or deadline, like a stalled network call.
*/
class FakeExtractionService : public ExtractionService {
 public:
  std::string ocr_text     = "Bottle 4oz 9:15";
  std::string model_output = R"([{"type": "bottle", "startTime": "09:15", "quantity": "4oz", "details": "Formula"}])";
  Status      ocr_status;
  Status      extract_status;
  bool        block = false;

  int                      ocr_calls     = 0;
  int                      extract_calls = 0;
  v1::ExtractEventsRequest last_request;

  StatusOr<v1::RecognizeTextResponse> RecognizeText(const v1::RecognizeTextRequest& request, const CallOptions&) override {
    ++ocr_calls;
    assert(request.image().size() > 0);
    if (!ocr_status.ok()) return ocr_status;
    v1::RecognizeTextResponse response;
    response.set_text(ocr_text);
    return response;
  }

  StatusOr<v1::ExtractEventsResponse> ExtractEvents(const v1::ExtractEventsRequest& request, const CallOptions& options) override {
    ++extract_calls;
    last_request = request;
    if (block) return Block(options);
    if (!extract_status.ok()) return extract_status;
    v1::ExtractEventsResponse response;
    response.set_model_output(model_output);
    return response;
  }

 private:
  static Status Block(const CallOptions& options) {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled    = false;
    auto                    registration = options.cancellation.OnCancel([&] {
      std::lock_guard<std::mutex> lock(mutex);
      cancelled = true;
      cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex);
    if (!cv.wait_until(lock, options.deadline, [&] { return cancelled; })) {
      return Status::Err(StatusCode::kDeadlineExceeded, "deadline exceeded");
    }
    return Status::Err(StatusCode::kCancelled, "cancelled");
  }
};

SourceDocument TextDocument(std::string name, std::string text) {
  return SourceDocument{std::move(name), SourceFormat::kText, BufferFromString(std::move(text)), kDay};
}

SourceDocument ImageDocument() {
  return SourceDocument{"scan.png", SourceFormat::kImage, BufferFromString(std::string("\x89PNG\r\n\x1a\n", 8)), kDay};
}

void TestTextGoesStraightToExtraction() {
  auto            service = std::make_shared<FakeExtractionService>();
  ReportExtractor extractor(service);

  auto result = extractor.Extract(TextDocument("daily.csv", "09:15,Bottle,4oz"));
  assert(result.ok());
  assert(result->size() == 1);
  assert(service->ocr_calls == 0);
  assert(service->extract_calls == 1);
  assert(service->last_request.text() == "09:15,Bottle,4oz");
  assert(service->last_request.reference_date() == "2026-03-14");
  assert(service->last_request.source_context() == "daycare report csv");
  assert(service->last_request.instructions().find("HH:mm") != std::string::npos);
}

void TestImageIsRecognizedFirst() {
  auto            service = std::make_shared<FakeExtractionService>();
  ReportExtractor extractor(service);

  auto result = extractor.Extract(ImageDocument());
  assert(result.ok());
  assert(service->ocr_calls == 1);
  assert(service->last_request.text() == "Bottle 4oz 9:15");
  assert(service->last_request.source_context() == "daycare report image");
}

void TestEmptyOcrTextIsMalformed() {
  auto service      = std::make_shared<FakeExtractionService>();
  service->ocr_text = " \n\t";
  ReportExtractor extractor(service);

  auto result = extractor.Extract(ImageDocument());
  assert(result.status().code == StatusCode::kMalformedResponse);
  assert(result.status().message.find("no text detected") != std::string::npos);
  assert(service->extract_calls == 0);
}

void TestServiceFailuresKeepTheirClass() {
  auto service        = std::make_shared<FakeExtractionService>();
  service->ocr_status = Status::Err(StatusCode::kUnavailable, "connection refused");
  ReportExtractor extractor(service);

  auto ocr = extractor.Extract(ImageDocument());
  assert(ocr.status().code == StatusCode::kUnavailable);
  assert(ocr.status().IsTransient());

  service->extract_status = Status::Err(StatusCode::kUnavailable, "503");
  auto extract            = extractor.Extract(TextDocument("daily.txt", "Nap 1-2pm"));
  assert(extract.status().IsTransient());
}

void TestMalformedModelOutput() {
  auto service          = std::make_shared<FakeExtractionService>();
  service->model_output = "Sorry, I can't help with that.";
  ReportExtractor extractor(service);

  auto result = extractor.Extract(TextDocument("daily.txt", "Nap 1-2pm"));
  assert(result.status().code == StatusCode::kMalformedResponse);
}

void TestTimeoutIsDeadlineExceeded() {
  auto service   = std::make_shared<FakeExtractionService>();
  service->block = true;
  ReportExtractor extractor(service, ExtractorOptions{50ms});

  const auto started = std::chrono::steady_clock::now();
  auto       result  = extractor.Extract(TextDocument("daily.txt", "Nap 1-2pm"));
  assert(result.status().code == StatusCode::kDeadlineExceeded);
  assert(result.status().IsTransient());
  assert(std::chrono::steady_clock::now() - started < 5s);
}

void TestCancellationStopsTheCall() {
  auto service   = std::make_shared<FakeExtractionService>();
  service->block = true;
  ReportExtractor extractor(service, ExtractorOptions{60s});

  CancellationToken token;
  std::thread       canceller([token]() mutable {
    std::this_thread::sleep_for(50ms);
    token.Cancel();
  });

  auto result = extractor.Extract(TextDocument("daily.txt", "Nap 1-2pm"), token);
  canceller.join();
  assert(result.status().code == StatusCode::kCancelled);
  assert(!result.status().IsTransient());

  CancellationToken already;
  already.Cancel();
  service->extract_calls = 0;
  assert(extractor.Extract(TextDocument("daily.txt", "Nap"), already).status().code == StatusCode::kCancelled);
  assert(service->extract_calls == 0);
}

void TestInvalidInputIsRefusedBeforeAnyCall() {
  auto            service = std::make_shared<FakeExtractionService>();
  ReportExtractor extractor(service);

  auto latin1 = extractor.Extract(TextDocument("daily.txt", std::string("caf\xe9", 4)));
  assert(latin1.status().code == StatusCode::kUnsupportedFormat);
  assert(service->extract_calls == 0);

  ReportExtractor unconfigured(nullptr);
  assert(unconfigured.Extract(TextDocument("daily.txt", "Nap")).status().code == StatusCode::kInvalidState);
}

} // namespace

int main() {
  TestTextGoesStraightToExtraction();
  TestImageIsRecognizedFirst();
  TestEmptyOcrTextIsMalformed();
  TestServiceFailuresKeepTheirClass();
  TestMalformedModelOutput();
  TestTimeoutIsDeadlineExceeded();
  TestCancellationStopsTheCall();
  TestInvalidInputIsRefusedBeforeAnyCall();

  std::cout << "carelog_unit_report_extractor: pass\n";
  return 0;
}
