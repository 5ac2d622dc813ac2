#include <slatewatch/vision/gst_frame_source.hpp>
#include <slatewatch/core/latest_frame_buffer.hpp>
#include <gst/app/gstappsink.h>
#include <gst/gst.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace slatewatch::vision {

namespace sc = slatewatch::core;

namespace {

constexpr const char* kRtpCaps =
    "application/x-rtp, media=(string)video, clock-rate=(int)90000";

std::string rtp_source(const sc::SourceDescriptor& d, const char* encoding, int payload) {
  return "udpsrc address=" + d.address + " port=" + std::to_string(d.port) + " caps=\"" +
         kRtpCaps + ", encoding-name=(string)" + encoding +
         ", payload=(int)" + std::to_string(payload) + "\"";
}

const char* parser_for(sc::Codec codec) {
  return codec == sc::Codec::H265 ? "h265parse ! avdec_h265" : "h264parse ! avdec_h264";
}

constexpr const char* kSinkTail = "videoconvert ! videoscale ! video/x-raw,format=BGR ! appsink name=sink";

}  // namespace

std::string pipeline_description(const sc::SourceDescriptor& d) {
  switch (d.transport) {
    case sc::Transport::File:
      return "filesrc location=\"" + d.address + "\" ! decodebin ! " + kSinkTail;
    case sc::Transport::Test:
      return std::string("videotestsrc is-live=true ! video/x-raw,width=320,height=240,framerate=10/1 ! ") +
             kSinkTail;
    case sc::Transport::Udp:
    default:
      break;
  }
  if (d.container == sc::Container::MpegTs) {
    return rtp_source(d, "MP2T", 33) + " ! .recv_rtp_sink_0 rtpbin ! rtpmp2tdepay ! tsdemux ! " +
           parser_for(d.codec) + " ! " + kSinkTail;
  }
  const bool h265 = d.codec == sc::Codec::H265;
  return rtp_source(d, h265 ? "H265" : "H264", 96) + (h265 ? " ! rtph265depay" : " ! rtph264depay") +
         " ! decodebin ! " + kSinkTail;
}

struct GstFrameSource::Impl {
  std::mutex mu;  // guards the GStreamer handles
  GstElement* pipeline{nullptr};
  GstElement* appsink{nullptr};
  std::string description{"gstreamer (not opened)"};
  sc::LatestFrameBuffer buffer;
  std::atomic<std::uint64_t> next_sequence{1};

  static GstFlowReturn on_new_sample(GstAppSink* sink, gpointer user_data) {
    auto* self = static_cast<Impl*>(user_data);
    GstSample* sample = gst_app_sink_pull_sample(sink);
    if (!sample) return GST_FLOW_EOS;

    auto frame = self->sample_to_frame(sample);
    gst_sample_unref(sample);
    if (!frame) {
      spdlog::warn("Discarding undecodable sample from {}", self->description);
      return GST_FLOW_OK;
    }
    self->buffer.put(std::move(*frame));
    return GST_FLOW_OK;
  }

  static void on_eos(GstAppSink* /*sink*/, gpointer user_data) {
    auto* self = static_cast<Impl*>(user_data);
    spdlog::info("End of stream on {}", self->description);
    self->buffer.close(sc::WatchError::EndOfStream);
  }

  static GstBusSyncReply on_bus_message(GstBus* /*bus*/, GstMessage* msg, gpointer user_data) {
    auto* self = static_cast<Impl*>(user_data);
    switch (GST_MESSAGE_TYPE(msg)) {
      case GST_MESSAGE_ERROR: {
        GError* err = nullptr;
        gchar* debug = nullptr;
        gst_message_parse_error(msg, &err, &debug);
        spdlog::error("GStreamer error from {}: {} (debug: {})",
                      GST_OBJECT_NAME(GST_MESSAGE_SRC(msg)), err ? err->message : "unknown",
                      debug ? debug : "none");
        if (err) g_error_free(err);
        g_free(debug);
        self->buffer.close(sc::WatchError::SourceUnavailable);
        break;
      }
      case GST_MESSAGE_WARNING: {
        GError* err = nullptr;
        gchar* debug = nullptr;
        gst_message_parse_warning(msg, &err, &debug);
        spdlog::warn("GStreamer warning: {}", err ? err->message : "unknown");
        if (err) g_error_free(err);
        g_free(debug);
        break;
      }
      case GST_MESSAGE_EOS:
        self->buffer.close(sc::WatchError::EndOfStream);
        break;
      default:
        break;
    }
    // Nobody iterates the bus; dropping keeps it from growing.
    return GST_BUS_DROP;
  }

  std::optional<sc::Frame> sample_to_frame(GstSample* sample) {
    GstBuffer* buf = gst_sample_get_buffer(sample);
    GstCaps* caps = gst_sample_get_caps(sample);
    if (!buf || !caps) return std::nullopt;

    const GstStructure* structure = gst_caps_get_structure(caps, 0);
    int width = 0;
    int height = 0;
    gst_structure_get_int(structure, "width", &width);
    gst_structure_get_int(structure, "height", &height);
    if (width <= 0 || height <= 0) return std::nullopt;

    GstMapInfo map{};
    if (!gst_buffer_map(buf, &map, GST_MAP_READ)) return std::nullopt;

    // Rows may be padded; repack tightly.
    const std::size_t row = static_cast<std::size_t>(width) * 3;
    const std::size_t stride = map.size / static_cast<std::size_t>(height);
    if (stride < row) {
      gst_buffer_unmap(buf, &map);
      return std::nullopt;
    }
    std::vector<std::byte> pixels(row * static_cast<std::size_t>(height));
    for (int y = 0; y < height; ++y) {
      std::memcpy(pixels.data() + static_cast<std::size_t>(y) * row,
                  map.data + static_cast<std::size_t>(y) * stride, row);
    }
    gst_buffer_unmap(buf, &map);

    return sc::Frame(static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height),
                     sc::PixelFormat::BGR8, std::move(pixels),
                     next_sequence.fetch_add(1), std::chrono::system_clock::now());
  }

  void teardown() {
    if (pipeline) {
      gst_element_set_state(pipeline, GST_STATE_NULL);
    }
    if (appsink) {
      gst_object_unref(appsink);
      appsink = nullptr;
    }
    if (pipeline) {
      gst_object_unref(pipeline);
      pipeline = nullptr;
    }
  }
};

GstFrameSource::GstFrameSource() : impl_(std::make_unique<Impl>()) {}

GstFrameSource::~GstFrameSource() {
  close();
  std::lock_guard lock(impl_->mu);
  impl_->teardown();
}

std::expected<void, sc::WatchError> GstFrameSource::open(const sc::SourceDescriptor& descriptor) {
  std::lock_guard lock(impl_->mu);
  impl_->teardown();
  impl_->buffer.reset();

  if (!gst_is_initialized()) {
    GError* init_error = nullptr;
    if (!gst_init_check(nullptr, nullptr, &init_error)) {
      spdlog::error("Could not initialize GStreamer: {}",
                    init_error ? init_error->message : "unknown");
      if (init_error) g_error_free(init_error);
      return std::unexpected(sc::WatchError::SourceUnavailable);
    }
  }

  const std::string launch = pipeline_description(descriptor);
  spdlog::debug("Creating GStreamer pipeline: {}", launch);
  switch (descriptor.transport) {
    case sc::Transport::Udp:
      impl_->description = "rtp://" + descriptor.address + ":" + std::to_string(descriptor.port);
      break;
    case sc::Transport::File:
      impl_->description = "file://" + descriptor.address;
      break;
    case sc::Transport::Test:
      impl_->description = "videotestsrc";
      break;
  }

  GError* error = nullptr;
  impl_->pipeline = gst_parse_launch(launch.c_str(), &error);
  if (error) {
    spdlog::error("Pipeline parse error for {}: {}", impl_->description, error->message);
    g_error_free(error);
    impl_->teardown();
    return std::unexpected(sc::WatchError::SourceUnavailable);
  }

  impl_->appsink = gst_bin_get_by_name(GST_BIN(impl_->pipeline), "sink");
  if (!impl_->appsink) {
    spdlog::error("Pipeline for {} has no element named 'sink'", impl_->description);
    impl_->teardown();
    return std::unexpected(sc::WatchError::SourceUnavailable);
  }

  // Files play at their own rate; live feeds are pulled as fast as they arrive.
  const gboolean sync = descriptor.transport == sc::Transport::File ? TRUE : FALSE;
  g_object_set(G_OBJECT(impl_->appsink),
               "emit-signals", FALSE,
               "max-buffers", 1,
               "drop", TRUE,
               "sync", sync,
               nullptr);

  GstAppSinkCallbacks callbacks{};
  callbacks.eos = &Impl::on_eos;
  callbacks.new_sample = &Impl::on_new_sample;
  gst_app_sink_set_callbacks(GST_APP_SINK(impl_->appsink), &callbacks, impl_.get(), nullptr);

  GstBus* bus = gst_element_get_bus(impl_->pipeline);
  gst_bus_set_sync_handler(bus, &Impl::on_bus_message, impl_.get(), nullptr);
  gst_object_unref(bus);

  if (gst_element_set_state(impl_->pipeline, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
    spdlog::error("Failed to set pipeline for {} to PLAYING", impl_->description);
    impl_->teardown();
    return std::unexpected(sc::WatchError::SourceUnavailable);
  }

  spdlog::info("Pipeline started at {}", impl_->description);
  return {};
}

std::expected<sc::Frame, sc::WatchError> GstFrameSource::next_frame(
    std::chrono::milliseconds timeout) {
  return impl_->buffer.take(timeout);
}

void GstFrameSource::close() {
  impl_->buffer.close(sc::WatchError::EndOfStream);
  std::lock_guard lock(impl_->mu);
  if (impl_->pipeline) {
    spdlog::info("Stopping pipeline {}", impl_->description);
    gst_element_set_state(impl_->pipeline, GST_STATE_NULL);
  }
}

std::string GstFrameSource::describe() const {
  std::lock_guard lock(impl_->mu);
  return impl_->description;
}

std::uint64_t GstFrameSource::overwritten() const { return impl_->buffer.overwritten(); }

}  // namespace slatewatch::vision
