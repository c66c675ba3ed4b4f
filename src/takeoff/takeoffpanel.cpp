#include "takeoff/takeoffpanel.h"
#include "takeoff/takeoffledger.h"
#include "takeoff/takeoffaggregator.h"
#include "takeoff/coloroptions.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QFrame>
#include <QPushButton>
#include <QComboBox>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QScrollArea>
#include <QPixmap>
#include <QIcon>

TakeoffPanel::TakeoffPanel(TakeoffLedger* ledger, int categoryIndex, QWidget* parent)
    : QWidget(parent)
    , m_ledger(ledger)
    , m_categoryIndex(categoryIndex)
{
    if (const TakeoffCategory* cat = m_ledger ? m_ledger->category(categoryIndex) : nullptr) {
        m_wireEnabled = cat->wireEnabled;
    }

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(2, 2, 2, 2);
    layout->setSpacing(4);

    auto* buttons = new QHBoxLayout();
    m_addBtn = new QPushButton("Add Takeoff", this);
    m_saveBtn = new QPushButton("Save", this);
    buttons->addWidget(m_addBtn);
    buttons->addWidget(m_saveBtn);
    buttons->addStretch();
    layout->addLayout(buttons);

    m_totalsLabel = new QLabel("Totals: Count=0; Hours=0.00", this);
    layout->addWidget(m_totalsLabel);

    auto* scroll = new QScrollArea(this);
    scroll->setWidgetResizable(true);
    auto* container = new QWidget(scroll);
    m_entriesLayout = new QVBoxLayout(container);
    m_entriesLayout->setAlignment(Qt::AlignTop);
    scroll->setWidget(container);
    layout->addWidget(scroll);

    connect(m_addBtn, &QPushButton::clicked, this, [this]() { addTakeoff(); });
    connect(m_saveBtn, &QPushButton::clicked, this, &TakeoffPanel::saveRequested);

    if (m_ledger) {
        connect(m_ledger, &TakeoffLedger::entryAdded, this, &TakeoffPanel::onEntryAdded);
        connect(m_ledger, &TakeoffLedger::entryRemoved, this, &TakeoffPanel::onEntryRemoved);
        connect(m_ledger, &TakeoffLedger::entryChanged, this, &TakeoffPanel::onEntryChanged);
        connect(m_ledger, &TakeoffLedger::countsChanged, this, &TakeoffPanel::refreshCounts);
        connect(m_ledger, &TakeoffLedger::activeEntryChanged, this, &TakeoffPanel::setActiveEntry);
    }
    reload();
}

void TakeoffPanel::reload()
{
    for (const EntryWidgets& w : m_items) {
        w.frame->deleteLater();
    }
    m_items.clear();
    m_nextNumber = 1;

    const TakeoffCategory* cat = m_ledger ? m_ledger->category(m_categoryIndex) : nullptr;
    if (cat) {
        for (const TakeoffEntry& e : cat->entries) buildEntryFrame(e.id);
    }
    refreshCounts();
}

int TakeoffPanel::addTakeoff()
{
    if (!m_ledger) return -1;
    // The frame is built from the entryAdded signal
    return m_ledger->addEntry(m_categoryIndex);
}

int TakeoffPanel::indexOfEntry(int entryId) const
{
    for (int i = 0; i < m_items.size(); ++i) {
        if (m_items[i].entryId == entryId) return i;
    }
    return -1;
}

void TakeoffPanel::onEntryAdded(int categoryIndex, int entryId)
{
    if (categoryIndex != m_categoryIndex) return;
    buildEntryFrame(entryId);
    refreshCounts();
}

void TakeoffPanel::onEntryRemoved(int categoryIndex, int entryId)
{
    if (categoryIndex != m_categoryIndex) return;
    const int idx = indexOfEntry(entryId);
    if (idx < 0) return;
    m_items[idx].frame->deleteLater();
    m_items.remove(idx);
    refreshCounts();
}

void TakeoffPanel::onEntryChanged(int entryId)
{
    const int idx = indexOfEntry(entryId);
    if (idx < 0 || m_blockUpdates) return;
    const TakeoffEntry* e = m_ledger->entry(entryId);
    if (!e) return;

    // Reflect changes made outside this editor
    EntryWidgets& w = m_items[idx];
    m_blockUpdates = true;
    w.shape->setCurrentIndex(e->shapeKind == MarkupShape::Kind::Rectangle ? 0 : 1);
    w.color->setCurrentText(e->colorName);
    m_blockUpdates = false;
}

void TakeoffPanel::buildEntryFrame(int entryId)
{
    const TakeoffEntry* e = m_ledger ? m_ledger->entry(entryId) : nullptr;
    if (!e || indexOfEntry(entryId) >= 0) return;

    EntryWidgets w;
    w.entryId = entryId;
    w.frame = new QFrame();
    w.frame->setFrameShape(QFrame::StyledPanel);
    auto* layout = new QVBoxLayout(w.frame);

    // Row 1: identity and drawing
    auto* r1 = new QHBoxLayout();
    w.title = new QLabel(QString("Takeoff %1").arg(m_nextNumber++), w.frame);
    w.drawBtn = new QPushButton("Draw", w.frame);
    w.color = new QComboBox(w.frame);
    for (const NamedColor& c : ColorOptions::palette()) {
        QPixmap swatch(12, 12);
        swatch.fill(c.color);
        w.color->addItem(QIcon(swatch), c.name);
    }
    w.color->setCurrentText(e->colorName);
    w.shape = new QComboBox(w.frame);
    w.shape->addItems({"Rectangle", "Line"});
    w.shape->setCurrentIndex(e->shapeKind == MarkupShape::Kind::Rectangle ? 0 : 1);
    r1->addWidget(w.title);
    r1->addWidget(w.drawBtn);
    r1->addWidget(w.color);
    r1->addWidget(w.shape);
    r1->addStretch();
    layout->addLayout(r1);

    // Row 2: quantities
    auto* r2 = new QHBoxLayout();
    w.count = new QLabel("Count: 0", w.frame);
    w.name = new QLineEdit(e->name, w.frame);
    w.name->setPlaceholderText("Name");
    w.labor = new QLineEdit(e->laborText, w.frame);
    w.labor->setPlaceholderText("0.0");
    w.labor->setFixedWidth(60);
    r2->addWidget(w.count);
    r2->addWidget(w.name);
    r2->addWidget(new QLabel("Labor:", w.frame));
    r2->addWidget(w.labor);

    if (m_wireEnabled) {
        w.wireType = new QComboBox(w.frame);
        w.wireType->addItems(ColorOptions::wireTypes());
        w.wireType->setCurrentText(e->wireType);
        w.wireCable = new QComboBox(w.frame);
        w.wireCable->addItems(ColorOptions::cableSpecs());
        w.wireCable->setCurrentText(e->wireCable);
        w.wireMaterial = new QComboBox(w.frame);
        w.wireMaterial->addItems(ColorOptions::materials());
        w.wireMaterial->setCurrentText(WireKey::materialCode(e->wireMaterial));
        w.length = new QLineEdit(e->lengthText, w.frame);
        w.length->setPlaceholderText("0.0");
        w.length->setFixedWidth(60);
        r2->addWidget(w.wireType);
        r2->addWidget(w.wireCable);
        r2->addWidget(w.wireMaterial);
        r2->addWidget(new QLabel("Length:", w.frame));
        r2->addWidget(w.length);
    }

    auto* deleteBtn = new QPushButton("Delete", w.frame);
    w.notesBtn = new QPushButton("Show Notes", w.frame);
    r2->addWidget(deleteBtn);
    r2->addWidget(w.notesBtn);
    layout->addLayout(r2);

    w.notes = new QPlainTextEdit(e->notes, w.frame);
    w.notes->setFixedHeight(100);
    w.notes->setVisible(false);
    layout->addWidget(w.notes);

    m_entriesLayout->addWidget(w.frame);

    // Edits flow into the ledger; the ledger is the only owner of values
    connect(w.drawBtn, &QPushButton::clicked, this, [this, entryId]() {
        m_ledger->setActiveEntry(entryId);
        emit drawRequested(entryId);
    });
    connect(w.color, &QComboBox::currentTextChanged, this, [this, entryId](const QString& name) {
        if (m_blockUpdates) return;
        m_blockUpdates = true;
        m_ledger->setEntryColor(entryId, name, ColorOptions::colorFor(name));
        m_blockUpdates = false;
    });
    connect(w.shape, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this, entryId](int index) {
        if (m_blockUpdates) return;
        m_blockUpdates = true;
        m_ledger->setEntryShapeKind(entryId, index == 0 ? MarkupShape::Kind::Rectangle : MarkupShape::Kind::Line);
        m_blockUpdates = false;
    });
    connect(w.name, &QLineEdit::textChanged, this, [this, entryId](const QString& text) {
        m_ledger->setEntryName(entryId, text);
    });
    connect(w.labor, &QLineEdit::textChanged, this, [this, entryId](const QString& text) {
        m_ledger->setEntryLabor(entryId, text);
    });
    connect(w.notes, &QPlainTextEdit::textChanged, this, [this, entryId]() {
        const int idx = indexOfEntry(entryId);
        if (idx >= 0) m_ledger->setEntryNotes(entryId, m_items[idx].notes->toPlainText());
    });
    connect(w.notesBtn, &QPushButton::clicked, this, [this, entryId]() {
        const int idx = indexOfEntry(entryId);
        if (idx < 0) return;
        const EntryWidgets& item = m_items[idx];
        item.notes->setVisible(!item.notes->isVisible());
        item.notesBtn->setText(item.notes->isVisible() ? "Hide Notes" : "Show Notes");
    });
    connect(deleteBtn, &QPushButton::clicked, this, [this, entryId]() {
        m_ledger->removeEntry(m_categoryIndex, entryId);
    });

    if (m_wireEnabled) {
        auto push = [this, entryId]() {
            const int idx = indexOfEntry(entryId);
            if (idx >= 0) pushWire(m_items[idx]);
        };
        connect(w.wireType, &QComboBox::currentTextChanged, this, push);
        connect(w.wireCable, &QComboBox::currentTextChanged, this, push);
        connect(w.wireMaterial, &QComboBox::currentTextChanged, this, push);
        connect(w.length, &QLineEdit::textChanged, this, push);
    }

    m_items.append(w);
    setActiveEntry(m_ledger->activeEntry());
}

void TakeoffPanel::pushWire(const EntryWidgets& w)
{
    if (!m_wireEnabled) return;
    m_ledger->setEntryWire(w.entryId,
                           w.wireType->currentText(),
                           w.wireCable->currentText(),
                           WireKey::materialFromCode(w.wireMaterial->currentText()),
                           w.length->text());
}

void TakeoffPanel::refreshCounts()
{
    const TakeoffCategory* cat = m_ledger ? m_ledger->category(m_categoryIndex) : nullptr;
    if (!cat) return;

    for (const EntryWidgets& w : m_items) {
        w.count->setText(QString("Count: %1").arg(m_ledger->entryCount(w.entryId)));
    }
    m_totalsLabel->setText(QString("Totals: Count=%1; Hours=%2")
                               .arg(TakeoffAggregator::categoryCount(*cat))
                               .arg(TakeoffAggregator::categoryHours(*cat), 0, 'f', 2));
}

void TakeoffPanel::setActiveEntry(int entryId)
{
    for (const EntryWidgets& w : m_items) {
        const bool active = (w.entryId == entryId);
        w.frame->setFrameShadow(active ? QFrame::Sunken : QFrame::Plain);
        w.frame->setLineWidth(active ? 2 : 1);
        w.drawBtn->setDefault(active);
    }
}
