#include "panels/Separator.hpp"
#include "panels/PanelStream.hpp"

namespace lazybar::panels {

namespace {

class SeparatorStream : public PanelStream {
public:
    SeparatorStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                    std::string text)
        : PanelStream(std::move(common), surface, attrs, height), text_(std::move(text)) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker&) override {
        if (drawn_) return runtime::Poll<bool>::done();
        drawn_ = true;
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override { return draw_text(text_); }

private:
    std::string text_;
    bool drawn_ = false;
};

}  // namespace

PanelConfigPtr Separator::parse(const std::string& name, const config::Table& table,
                                const config::Config& global) {
    auto separator = std::make_unique<Separator>();
    separator->common_ = PanelCommon::parse(name, table, global);
    separator->text_ = PanelCommon::parse_format(table, "", " | ");
    return separator;
}

PanelRun Separator::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                        runtime::Scheduler&) {
    PanelRun run;
    run.stream = std::make_unique<SeparatorStream>(common_, surface, default_attrs, height, text_);
    return run;
}

}  // namespace lazybar::panels
