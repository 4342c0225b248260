#include "dcp/runner.hpp"
#include "dcp/background.hpp"
#include "dcp/errors.hpp"
#include "dcp/extraction_coordinator.hpp"
#include "dcp/hdf5_array.hpp"
#include "dcp/logger.hpp"
#include "dcp/tracer.hpp"
#include <algorithm>
#include <thread>

namespace dcp {
namespace {
constexpr double kDefaultPixelSize = 0.34;

TimeInfo read_time_info(const Hdf5File& in) {
    TimeInfo info;
    if (in.has("events/time")) info.time = in.read_vector("events/time");
    if (in.has("events/frame")) info.frame = in.read_vector("events/frame");
    if (in.has_attr("imaging:frame rate")) info.frame_rate = in.attr_double("imaging:frame rate");
    return info;
}

SourcePtr prepare_background(const PipelineConfig& cfg, const FilePtr& in, const FilePtr& out,
                             const SourcePtr& image, std::string& bg_id, Metrics& metrics) {
    auto bg_kwargs = BackgroundSparseMedian::get_ppkw_from_ppid(cfg.background);
    bg_id = BackgroundSparseMedian::get_ppid_from_ppkw(bg_kwargs);

    if (in->has("events/image_bg") && in->has_attr("pipeline:background") &&
        in->attr_string("pipeline:background") == bg_id) {
        Logger::info("[run] Reusing background %s from %s", bg_id.c_str(), in->path().c_str());
        return std::make_shared<Hdf5ImageDataset>(in, "events/image_bg");
    }

    DCP_TRACE_METRICS(metrics, "background", 0);
    auto bg_out = Hdf5ImageDataset::create(out, "events/image_bg", image->frame_size(), CV_8U, 0);
    BackgroundSparseMedian bg(image, bg_out, SparseMedianParams::from_kwargs(bg_kwargs),
                              read_time_info(*in), cfg.workers);
    bg_id = bg.get_ppid();
    Logger::info("[run] Computing background %s", bg_id.c_str());
    bg.process();
    return bg_out;
}
}  // namespace

PipelineSummary run_extraction(MeasurementData& data, const SegmenterThresh& segmenter,
                               const Gate& gate, const ExtractParams& params, EventSink& sink,
                               const ExtractionOptions& options, FeatureFunctions functions,
                               Metrics* metrics) {
    const int n = data.length();
    const int chunk_size = data.image().chunk_size();
    const cv::Size frame_size = data.image().frame_size();
    int workers = options.workers > 0 ? options.workers
                                      : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    if (options.debug) workers = 1;

    ExtractionShared shared(n, chunk_size, frame_size, workers);
    SlotArray slots(options.slots, chunk_size, frame_size);
    WriterDeque writer_dq;

    DequeWriter writer(writer_dq, sink, n);
    QueueCollector collector(shared, writer_dq, n);
    ExtractionCoordinator coordinator(slots, data, std::make_shared<const Gate>(gate), shared,
                                      make_execution_context(options.debug),
                                      [&writer_dq] { return writer_dq.size(); }, params,
                                      std::move(functions), metrics);
    SegmenterManager segmenter_mgr(segmenter, data.image_corr(), slots);

    auto stop_all = [&] {
        slots.abort();
        collector.request_stop();
        writer.request_stop();
    };
    collector.set_on_error(stop_all);
    writer.set_on_error(stop_all);

    Logger::info("[run] Processing %d frames in %d chunks with %d workers", n,
                 data.image().num_chunks(), workers);
    writer.start();
    collector.start();
    coordinator.start();
    segmenter_mgr.start();

    // A stage that only stopped because another one failed does not hide
    // the failure itself.
    std::exception_ptr first, aborted;
    auto join = [&](auto& stage) {
        try {
            stage.join();
        } catch (const PipelineAborted&) {
            if (!aborted) aborted = std::current_exception();
            stop_all();
        } catch (...) {
            if (!first) first = std::current_exception();
            stop_all();
        }
    };
    join(segmenter_mgr);
    join(coordinator);
    join(collector);
    join(writer);
    if (first) std::rethrow_exception(first);
    if (aborted) std::rethrow_exception(aborted);

    PipelineSummary summary;
    summary.frames = n;
    summary.events = writer.events_written();
    summary.invalid_masks = shared.invalid_masks.load();
    summary.failed_frames = shared.failed_items.load();
    summary.extraction_seconds = coordinator.extraction_seconds();
    return summary;
}

PipelineSummary run_pipeline(const PipelineConfig& cfg, Metrics* metrics) {
    Metrics own;
    Metrics& m = metrics ? *metrics : own;

    auto in = std::make_shared<Hdf5File>(cfg.input_path, Hdf5File::Mode::ReadOnly);
    if (!in->has("events/image")) throw IoError(cfg.input_path + " has no events/image");
    auto image = std::make_shared<Hdf5ImageDataset>(in, "events/image");
    if (image->type() != CV_8U) throw IoError("events/image must be uint8");
    auto out = std::make_shared<Hdf5File>(cfg.output_path, Hdf5File::Mode::Truncate);

    // Decode every stage first so that a bad identifier fails before any work.
    auto seg_kw = SegmenterThresh::get_ppkw_from_ppid(cfg.segmenter);
    SegmenterThresh segmenter(ThreshParams::from_kwargs(seg_kw.first),
                              MaskPostParams::from_kwargs(seg_kw.second));
    ExtractParams extract = ExtractParams::from_kwargs(EventExtractor::get_ppkw_from_ppid(cfg.features));
    Gate gate(GateParams::from_kwargs(Gate::get_ppkw_from_ppid(cfg.gate)), cfg.box_gates);

    double pixel_size = cfg.pixel_size;
    if (pixel_size <= 0) {
        pixel_size = in->has_attr("imaging:pixel size") ? in->attr_double("imaging:pixel size")
                                                         : kDefaultPixelSize;
    }

    std::string bg_id;
    SourcePtr image_bg = prepare_background(cfg, in, out, image, bg_id, m);
    MeasurementData data(image, image_bg, pixel_size, cfg.chunk_size, cfg.cache_size);

    Hdf5EventSink sink(out, image->frame_size());
    ExtractionOptions options{cfg.workers, cfg.slots, cfg.debug};
    PipelineSummary summary = run_extraction(data, segmenter, gate, extract, sink, options, {}, &m);
    sink.flush();

    const std::string gen_id = kPipelineGeneration;
    const std::string dat_id = data.get_ppid();
    const std::string seg_id = segmenter.get_ppid();
    const std::string feat_id = EventExtractor::get_ppid_from_ppkw(extract.to_kwargs());
    const std::string gate_id = gate.get_ppid();
    summary.hash = compute_pipeline_hash(gen_id, dat_id, bg_id, seg_id, feat_id, gate_id);

    out->set_attr("pipeline:generation", gen_id);
    out->set_attr("pipeline:data", dat_id);
    out->set_attr("pipeline:background", bg_id);
    out->set_attr("pipeline:segmenter", seg_id);
    out->set_attr("pipeline:feature", feat_id);
    out->set_attr("pipeline:gate", gate_id);
    out->set_attr("pipeline:hash", summary.hash);
    out->set_attr("imaging:pixel size", pixel_size);
    out->flush();

    Logger::info("[run] %llu events from %d frames, hash %s",
                 static_cast<unsigned long long>(summary.events), summary.frames, summary.hash.c_str());
    return summary;
}
}
